#ifndef LEGATO_PUMP_HPP
#define LEGATO_PUMP_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "command_transport.hpp"
#include "pump_common.hpp"
#include "pump_config.hpp"
#include "run_lifecycle.hpp"
#include "serial_link.hpp"

/**
 * @brief KDS Legato 110 单通道注射泵驱动
 *
 * 构造时完成握手：检查通信设置和设备型号，配置脚踏开关和力度，
 * 然后读取状态、注射器类型、流量限值、流量、目标体积和运行方向。
 * 所有 set 操作先检查参数，发送命令后回读确认。
 */
class LegatoPump {
public:
    /**
     * @brief 打开配置中的串口并完成握手
     * @param config 驱动配置
     * @throws ConnectivityError 串口无法打开或设备型号不符
     */
    explicit LegatoPump(const PumpConfig& config);

    /**
     * @brief 使用已打开的串口完成握手
     * @param link 串口，驱动独占
     * @param config 驱动配置
     */
    LegatoPump(std::unique_ptr<SerialLink> link, const PumpConfig& config);

    /**
     * @brief 析构函数，关闭串口
     */
    ~LegatoPump();

    LegatoPump(const LegatoPump&) = delete;
    LegatoPump& operator=(const LegatoPump&) = delete;

    std::string getEcho();
    std::string getPoll();
    std::string getAddress();

    /**
     * @brief 设备型号字符串，例如 "Legato 110 ..."
     */
    std::string getVer();

    /**
     * @brief 扩展版本信息（三行）
     */
    std::vector<std::string> getVersion();

    FootswitchMode getFootswitchMode();

    /**
     * @brief 设置脚踏开关触发方式
     * @param mode 触发方式
     */
    void setFootswitchMode(FootswitchMode mode);

    int getForce();

    /**
     * @brief 设置推力百分比
     * @param force_pct 1 到 100
     */
    void setForce(int force_pct);

    PumpStatus getStatus();

    /**
     * @brief 估算抽取和注射的运行时间
     * @return (抽取秒数, 注射秒数)
     * @throws ValidationError 未设置目标体积或流量为零
     */
    std::pair<double, double> estimateRunTime();

    std::string getSyringeType();

    /**
     * @brief 读取流量限值
     * @return (抽取限值原始字符串, 注射限值原始字符串)
     */
    std::pair<std::string, std::string> getFlowRateLimits();

    /**
     * @brief 读取当前流量
     * @return (抽取流量原始字符串, 注射流量原始字符串)
     */
    std::pair<std::string, std::string> getFlowRates();

    /**
     * @brief 设置流量
     * @param direction 方向
     * @param rate 整数流量，避免浮点误差
     * @param unit 流量单位，例如 "ul/min"
     * @throws ValidationError 参数非法或超出限值
     * @throws PostConditionError 回读流量不一致
     */
    void setFlowRate(RunDirection direction, int64_t rate, const std::string& unit);

    /**
     * @brief 把流量设置为设备报告的最小或最大值
     */
    void setFlowRate(RunDirection direction, RateBound bound);

    /**
     * @brief 读取目标体积
     * @return 设备原始字符串，未设置时为 "Target volume not set"
     */
    std::string getTargetVolume();

    /**
     * @brief 设置目标体积
     * @param volume 非零体积
     * @param unit ml / ul / nl / pl
     */
    void setTargetVolume(double volume, const std::string& unit);

    RunDirection getRunDirection();
    void setRunDirection(RunDirection direction);

    /**
     * @brief 运行当前程序
     * @param block 为 true 时等待运行结束
     */
    void run(bool block = true);

    /**
     * @brief 等待非阻塞运行结束
     *
     * 其他命令可能已经吸收了完成通知，调用前先检查 isRunning()。
     * @throws InvariantViolation 当前未运行
     */
    void finishRunning();

    /**
     * @brief 停止运行
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief 关闭串口，可重复调用，不抛异常
     */
    void close();

    /**
     * @brief 最近一次读取到的缓存值
     */
    PumpSnapshot snapshot() const;

    const RateLimits& rateLimits(RunDirection direction) const;

    const PumpConfig& config() const { return config_; }

private:
    PumpConfig config_;
    std::unique_ptr<SerialLink> link_;
    CommandTransport transport_;
    RunLifecycle lifecycle_;
    PumpSnapshot cache_;
    bool closed_ = false;

    static SerialLink& checkedLink(const std::unique_ptr<SerialLink>& link);

    void initialize();

    /**
     * @brief 发送只返回一行的查询命令
     */
    std::string queryLine(const std::string& command);

    /**
     * @brief 解析 "<数值> <流量单位>"
     */
    int64_t parseRate(const std::string& reply);
};

#endif // LEGATO_PUMP_HPP
