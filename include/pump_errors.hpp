#ifndef PUMP_ERRORS_HPP
#define PUMP_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief 驱动所有异常的基类
 */
class PumpError : public std::runtime_error {
public:
    explicit PumpError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief 串口无法打开或读写系统调用失败
 */
class ConnectivityError : public PumpError {
public:
    explicit ConnectivityError(const std::string& what) : PumpError(what) {}
};

/**
 * @brief 帧失步：行数不符、未知提示符、多余数据等
 * @note 之后的协议状态未知，不做任何恢复
 */
class ProtocolViolation : public PumpError {
public:
    explicit ProtocolViolation(const std::string& what) : PumpError(what) {}
};

/**
 * @brief 调用者提供的参数不合法，命令未发送
 */
class ValidationError : public PumpError {
public:
    explicit ValidationError(const std::string& what) : PumpError(what) {}
};

/**
 * @brief 回读值与请求值不一致
 */
class PostConditionError : public PumpError {
public:
    explicit PostConditionError(const std::string& what) : PumpError(what) {}
};

/**
 * @brief 调用顺序错误等编程错误
 */
class InvariantViolation : public PumpError {
public:
    explicit InvariantViolation(const std::string& what) : PumpError(what) {}
};

#endif // PUMP_ERRORS_HPP
