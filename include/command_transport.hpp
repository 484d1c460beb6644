#ifndef COMMAND_TRANSPORT_HPP
#define COMMAND_TRANSPORT_HPP

#include <functional>
#include <string>
#include <vector>
#include "pump_common.hpp"
#include "serial_link.hpp"

/**
 * @brief 一次命令交换的结果
 */
struct ExchangeResult
{
    std::vector<std::string> lines; // 去掉首尾空白后的应答行
    PumpPrompt prompt = PROMPT_IDLE;
};

/**
 * @brief 命令/应答传输层
 *
 * 每条命令以 '\r' 结尾发送；设备先回一个空行，再回声明数量的应答行，
 * 最后是提示符。提示符之后若仍有数据且泵处于运行中，说明上一次非阻塞
 * 运行的完成提示符与本次应答一起到达，由本类统一吸收。
 */
class CommandTransport
{
public:
    using RunningQuery = std::function<bool()>;
    using CompletionCallback = std::function<void()>;

    /**
     * @brief 构造函数
     * @param link 串口，由调用者保证生命周期
     * @param name 设备名称，用于日志和异常信息
     */
    CommandTransport(SerialLink &link, const std::string &name);

    /**
     * @brief 发送命令并读取应答
     * @param command 命令文本（不含 '\r'）
     * @param expected_lines 应答行数
     * @return 应答行和提示符
     * @throws ProtocolViolation 行数不符、未知提示符或多余数据
     */
    ExchangeResult exchange(const std::string &command, size_t expected_lines);

    /**
     * @brief 读取并解码一个提示符，'T' 之后必须是 '*'
     * @throws ProtocolViolation 未知提示符或超时
     */
    PumpPrompt readPrompt();

    /**
     * @brief 读取运行完成通知：一个空行加 "T*"，之后不能再有数据
     * @throws ProtocolViolation 通知格式不符
     */
    void readCompletion();

    /**
     * @brief 读取排在运行完成通知之后才到达的应答：一个空行加提示符
     * @param command 应答所属的命令，用于日志和异常信息
     * @return 命令的提示符，不能是 "T*"
     * @throws ProtocolViolation 超时、格式不符或多余数据
     */
    PumpPrompt readLateReply(const std::string &command);

    /**
     * @brief 设置运行状态查询和延迟完成回调，由运行生命周期管理器注册
     */
    void setCompletionHooks(RunningQuery is_running, CompletionCallback on_deferred_completion);

    SerialLink &link() { return link_; }

    const std::string &name() const { return name_; }

private:
    SerialLink &link_;
    std::string name_;
    RunningQuery isRunning_;
    CompletionCallback onDeferredCompletion_;

    void discardBlankLine(const std::string &context);

    void drainDeferredCompletion(const std::string &command, size_t expected_lines, ExchangeResult &result);

    /**
     * @brief 读出剩余的一行，仅用于错误信息
     */
    std::string readLeftover();
};

#endif // COMMAND_TRANSPORT_HPP
