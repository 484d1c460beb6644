#ifndef RUN_LIFECYCLE_HPP
#define RUN_LIFECYCLE_HPP

#include <string>
#include "command_transport.hpp"
#include "pump_common.hpp"

/**
 * @brief 运行生命周期管理器，是 RunState 唯一的修改者
 *
 * 进入 RUN_RUNNING 只能通过 run()；离开只能通过观察到 "T*"
 * （finishRunning() 或传输层吸收的延迟完成通知）或 stop()。
 */
class RunLifecycle
{
public:
    /**
     * @brief 构造函数，向传输层注册延迟完成回调
     * @param transport 传输层引用
     */
    explicit RunLifecycle(CommandTransport &transport);

    ~RunLifecycle();

    RunLifecycle(const RunLifecycle &) = delete;
    RunLifecycle &operator=(const RunLifecycle &) = delete;

    /**
     * @brief 运行当前程序
     * @param block 为 true 时等待运行完成
     * @note 若上一次运行尚未完成，先等待其完成
     */
    void run(bool block = true);

    /**
     * @brief 等待当前运行完成，期间取消读超时
     * @throws InvariantViolation 当前未运行
     * @throws ProtocolViolation 完成通知格式不符
     */
    void finishRunning();

    /**
     * @brief 无条件发送 stop 并清除运行状态
     *
     * 运行中 stop 可能与完成通知同时发生，完成通知在应答之前或之后到达都会被计入，
     * 串口中不会留下属于 stop 的数据。
     */
    void stop();

    bool isRunning() const;

    RunState state() const { return state_; }

    /**
     * @brief 已观察到的运行完成次数（包括延迟吸收的）
     */
    int completionCount() const { return completions_; }

private:
    CommandTransport &transport_;
    RunState state_ = RUN_IDLE;
    int completions_ = 0;

    void onDeferredCompletion();
};

#endif // RUN_LIFECYCLE_HPP
