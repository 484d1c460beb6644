#include "run_lifecycle.hpp"
#include "logger.hpp"
#include "pump_errors.hpp"

namespace
{
    // 作用域内修改串口超时，离开时恢复
    class TimeoutOverride
    {
    public:
        TimeoutOverride(SerialLink &link, int timeout_ms) : link_(link), saved_(link.timeout())
        {
            link_.setTimeout(timeout_ms);
        }
        ~TimeoutOverride()
        {
            link_.setTimeout(saved_);
        }

    private:
        SerialLink &link_;
        int saved_;
    };
}

RunLifecycle::RunLifecycle(CommandTransport &transport) : transport_(transport)
{
    transport_.setCompletionHooks([this]()
                                  { return isRunning(); },
                                  [this]()
                                  { onDeferredCompletion(); });
}

RunLifecycle::~RunLifecycle()
{
    transport_.setCompletionHooks(nullptr, nullptr);
}

bool RunLifecycle::isRunning() const
{
    return state_ != RUN_IDLE;
}

void RunLifecycle::run(bool block)
{
    if (isRunning())
    {
        finishRunning();
    }

    LegatoLogger::info("{}: 开始运行", transport_.name());
    // 先标记运行，使 run 的应答里夹带的完成通知也能被吸收
    state_ = RUN_RUNNING;
    try
    {
        transport_.exchange("run", 0);
    }
    catch (...)
    {
        state_ = RUN_IDLE;
        throw;
    }

    if (block && isRunning())
    {
        finishRunning();
    }
}

void RunLifecycle::finishRunning()
{
    if (state_ != RUN_RUNNING)
    {
        LegatoLogger::error("{}: finishRunning() 调用时泵未运行", transport_.name());
        throw InvariantViolation(transport_.name() + ": finishRunning() called while not running");
    }

    state_ = RUN_PENDING_FINISH;
    try
    {
        // 实际运行时间不定，等待期间不设超时
        TimeoutOverride wait(transport_.link(), SerialLink::kWaitForever);
        transport_.readCompletion();
    }
    catch (...)
    {
        state_ = RUN_RUNNING;
        throw;
    }

    state_ = RUN_IDLE;
    ++completions_;
    LegatoLogger::info("{}:  -> 运行完成", transport_.name());
}

void RunLifecycle::stop()
{
    LegatoLogger::info("{}: 停止", transport_.name());
    try
    {
        ExchangeResult result = transport_.exchange("stop", 0);
        // 完成通知先于 stop 的应答到达，且应答尚未到齐：
        // 读到的 "T*" 属于运行完成，stop 自己的应答随后才到
        if (state_ == RUN_RUNNING && result.prompt == PROMPT_TARGET_REACHED)
        {
            LegatoLogger::warn("{}: 运行完成通知先于 stop 的应答到达", transport_.name());
            transport_.readLateReply("stop");
            onDeferredCompletion();
        }
    }
    catch (...)
    {
        state_ = RUN_IDLE;
        throw;
    }
    state_ = RUN_IDLE;
}

void RunLifecycle::onDeferredCompletion()
{
    state_ = RUN_IDLE;
    ++completions_;
    LegatoLogger::info("{}:  -> 运行完成 (延迟通知)", transport_.name());
}
