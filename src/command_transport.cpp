#include "command_transport.hpp"
#include "logger.hpp"
#include "prompt.hpp"
#include "pump_errors.hpp"
#include "reply_parser.hpp"

CommandTransport::CommandTransport(SerialLink &link, const std::string &name)
    : link_(link), name_(name)
{
}

void CommandTransport::setCompletionHooks(RunningQuery is_running, CompletionCallback on_deferred_completion)
{
    isRunning_ = is_running;
    onDeferredCompletion_ = on_deferred_completion;
}

ExchangeResult CommandTransport::exchange(const std::string &command, size_t expected_lines)
{
    std::string frame = command + "\r";
    LegatoLogger::wire(name_, "tx", frame);
    link_.write(frame);

    discardBlankLine(command);

    ExchangeResult result;
    for (size_t i = 0; i < expected_lines; ++i)
    {
        std::string line;
        if (!link_.readLine(line))
        {
            LegatoLogger::error("{}: '{}' 应答行数不足 ({}/{})", name_, command, i, expected_lines);
            throw ProtocolViolation(name_ + ": expected " + std::to_string(expected_lines) +
                                    " response lines to '" + command + "', got " + std::to_string(i));
        }
        line = strip(line);
        LegatoLogger::trace("{}: 应答 ({}) = {}", name_, i, line);
        result.lines.push_back(line);
    }

    result.prompt = readPrompt();

    if (link_.bytesAvailable() != 0)
    {
        if (isRunning_ && isRunning_())
        {
            drainDeferredCompletion(command, expected_lines, result);
        }
        else
        {
            std::string leftover = readLeftover();
            LegatoLogger::error("{}: '{}' 之后有多余数据: {}", name_, command, leftover);
            throw ProtocolViolation(name_ + ": unexpected response = " + leftover);
        }
    }
    return result;
}

PumpPrompt CommandTransport::readPrompt()
{
    char first = 0;
    if (!link_.readByte(first))
    {
        LegatoLogger::error("{}: 等待提示符超时", name_);
        throw ProtocolViolation(name_ + ": no prompt received");
    }

    std::string bytes(1, first);
    if (promptNeedsLookahead(first))
    {
        char second = 0;
        if (!link_.readByte(second))
        {
            LegatoLogger::error("{}: 提示符 'T' 之后超时", name_);
            throw ProtocolViolation(name_ + ": incomplete prompt 'T'");
        }
        bytes.push_back(second);
    }

    PumpPrompt prompt;
    if (!decodePrompt(bytes, prompt))
    {
        std::string leftover = readLeftover();
        LegatoLogger::error("{}: 未知提示符 = \"{}\" ({})", name_, LegatoLogger::escapeBytes(bytes), leftover);
        throw ProtocolViolation(name_ + ": unexpected prompt = \"" + LegatoLogger::escapeBytes(bytes) + "\" (" +
                                leftover + ")");
    }
    LegatoLogger::trace("{}: 提示符 = {} ({})", name_, promptToString(prompt), promptMessage(prompt));
    return prompt;
}

void CommandTransport::readCompletion()
{
    discardBlankLine("completion");
    PumpPrompt prompt = readPrompt();
    if (prompt != PROMPT_TARGET_REACHED)
    {
        LegatoLogger::error("{}: 运行完成时提示符为 {}", name_, promptToString(prompt));
        throw ProtocolViolation(name_ + ": expected target reached prompt, got " + promptToString(prompt));
    }
    if (link_.bytesAvailable() != 0)
    {
        std::string leftover = readLeftover();
        LegatoLogger::error("{}: 运行完成之后有多余数据: {}", name_, leftover);
        throw ProtocolViolation(name_ + ": unexpected data after completion = " + leftover);
    }
}

PumpPrompt CommandTransport::readLateReply(const std::string &command)
{
    discardBlankLine(command);
    PumpPrompt prompt = readPrompt();
    if (prompt == PROMPT_TARGET_REACHED)
    {
        LegatoLogger::error("{}: '{}' 的应答之前出现两次运行完成通知", name_, command);
        throw ProtocolViolation(name_ + ": repeated completion before reply to '" + command + "'");
    }
    if (link_.bytesAvailable() != 0)
    {
        std::string leftover = readLeftover();
        LegatoLogger::error("{}: '{}' 之后有多余数据: {}", name_, command, leftover);
        throw ProtocolViolation(name_ + ": unexpected response = " + leftover);
    }
    return prompt;
}

void CommandTransport::drainDeferredCompletion(const std::string &command, size_t expected_lines,
                                               ExchangeResult &result)
{
    LegatoLogger::warn("{}: 运行完成通知与 '{}' 的应答一起到达", name_, command);

    discardBlankLine("deferred completion");
    PumpPrompt deferred = readPrompt();
    if (deferred != PROMPT_TARGET_REACHED)
    {
        // 无应答行的命令（如 stop）可能排在完成通知之后才应答
        if (expected_lines == 0 && result.prompt == PROMPT_TARGET_REACHED)
        {
            result.prompt = deferred;
        }
        else
        {
            LegatoLogger::error("{}: 无法解析的运行完成通知, 提示符 = {}", name_, promptToString(deferred));
            throw ProtocolViolation(name_ + ": unexpected completion prompt = " + promptToString(deferred));
        }
    }

    if (link_.bytesAvailable() != 0)
    {
        std::string leftover = readLeftover();
        LegatoLogger::error("{}: 运行完成通知之后有多余数据: {}", name_, leftover);
        throw ProtocolViolation(name_ + ": unexpected data after completion = " + leftover);
    }

    if (onDeferredCompletion_)
    {
        onDeferredCompletion_();
    }
}

void CommandTransport::discardBlankLine(const std::string &context)
{
    std::string line;
    if (!link_.readLine(line))
    {
        LegatoLogger::error("{}: '{}' 没有应答", name_, context);
        throw ProtocolViolation(name_ + ": no reply to '" + context + "'");
    }
    if (!strip(line).empty())
    {
        LegatoLogger::error("{}: '{}' 之后应为空行, 收到: {}", name_, context, strip(line));
        throw ProtocolViolation(name_ + ": expected blank line after '" + context + "', got " + strip(line));
    }
}

std::string CommandTransport::readLeftover()
{
    std::string line;
    bool complete = link_.readLine(line);
    LegatoLogger::wire(name_, "rx", line);
    // 超时时保留已读到的部分
    return complete ? LegatoLogger::escapeBytes(line) : LegatoLogger::escapeBytes(line) + "...";
}
