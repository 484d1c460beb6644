#include "legato_pump.hpp"
#include "logger.hpp"
#include "parameter_validator.hpp"
#include "posix_serial_link.hpp"
#include "pump_errors.hpp"
#include "reply_parser.hpp"
#include "unit_converter.hpp"
#include <chrono>
#include <cmath>
#include <thread>
#include <spdlog/fmt/fmt.h>

namespace
{
    const char *kTargetVolumeNotSet = "Target volume not set";

    struct FootswitchReply
    {
        const char *reply;
        FootswitchMode mode;
    };

    // 下降沿触发需要 "Active low"
    const FootswitchReply kFootswitchReplies[] = {
        {"Momentary", FOOTSWITCH_MOMENTARY},
        {"Active high", FOOTSWITCH_RISE},
        {"Active low", FOOTSWITCH_FALL},
    };

    double roundMicros(double seconds)
    {
        return std::round(seconds * 1e6) / 1e6;
    }
}

LegatoPump::LegatoPump(const PumpConfig &config)
    : LegatoPump(std::make_unique<PosixSerialLink>(config.port, config.baud, config.timeout_ms), config)
{
}

LegatoPump::LegatoPump(std::unique_ptr<SerialLink> link, const PumpConfig &config)
    : config_(config),
      link_(std::move(link)),
      transport_(checkedLink(link_), config.name),
      lifecycle_(transport_)
{
    LegatoLogger::info("{}: 正在初始化 ({})", config_.name, config_.port);
    try
    {
        config_.validate();
        initialize();
    }
    catch (const std::exception &e)
    {
        LegatoLogger::error("{}: 初始化失败: {}", config_.name, e.what());
        close();
        throw;
    }
    LegatoLogger::info("{}: 初始化完成", config_.name);
}

LegatoPump::~LegatoPump()
{
    close();
}

SerialLink &LegatoPump::checkedLink(const std::unique_ptr<SerialLink> &link)
{
    if (!link)
    {
        throw ConnectivityError("no serial link");
    }
    return *link;
}

void LegatoPump::initialize()
{
    UnitConverter::verifyUnitTables();

    // 传输层依赖以下通信设置
    if (getEcho() != "OFF")
    {
        throw ProtocolViolation(config_.name + ": echo must be OFF");
    }
    if (getPoll() != "OFF")
    {
        throw ProtocolViolation(config_.name + ": poll must be OFF");
    }
    if (getAddress() != "0")
    {
        throw ProtocolViolation(config_.name + ": address must be 0");
    }

    std::string ver = getVer();
    if (ver.compare(0, config_.model_prefix.size(), config_.model_prefix) != 0)
    {
        throw ConnectivityError(config_.name + ": unexpected device (" +
                                ver.substr(0, config_.model_prefix.size()) + ")");
    }
    getVersion();

    setFootswitchMode(config_.footswitch_mode);
    setForce(config_.force_pct);

    getStatus();
    estimateRunTime();
    getSyringeType();
    getFlowRateLimits();
    getFlowRates();
    getTargetVolume();
    getRunDirection();
}

std::string LegatoPump::queryLine(const std::string &command)
{
    return transport_.exchange(command, 1).lines[0];
}

std::string LegatoPump::getEcho()
{
    std::string echo = queryLine("echo");
    LegatoLogger::debug("{}: echo = {}", config_.name, echo);
    return echo;
}

std::string LegatoPump::getPoll()
{
    std::string poll = queryLine("poll");
    LegatoLogger::debug("{}: poll = {}", config_.name, poll);
    return poll;
}

std::string LegatoPump::getAddress()
{
    std::string reply = queryLine("addr");
    std::vector<std::string> tokens = splitWhitespace(reply);
    if (tokens.size() < 4)
    {
        throw ProtocolViolation(config_.name + ": cannot parse address (" + reply + ")");
    }
    LegatoLogger::debug("{}: address = {}", config_.name, tokens[3]);
    return tokens[3];
}

std::string LegatoPump::getVer()
{
    cache_.version = queryLine("ver");
    LegatoLogger::debug("{}: ver = {}", config_.name, cache_.version);
    return cache_.version;
}

std::vector<std::string> LegatoPump::getVersion()
{
    cache_.version_long = transport_.exchange("version", 3).lines;
    for (const auto &line : cache_.version_long)
    {
        LegatoLogger::debug("{}:  -> {}", config_.name, line);
    }
    return cache_.version_long;
}

FootswitchMode LegatoPump::getFootswitchMode()
{
    std::string reply = queryLine("ftswitch");
    for (const auto &entry : kFootswitchReplies)
    {
        if (reply == entry.reply)
        {
            cache_.footswitch_mode = entry.mode;
            LegatoLogger::debug("{}: footswitch mode = {}", config_.name, footswitchModeToString(entry.mode));
            return entry.mode;
        }
    }
    throw ProtocolViolation(config_.name + ": unexpected footswitch reply (" + reply + ")");
}

void LegatoPump::setFootswitchMode(FootswitchMode mode)
{
    if (mode != FOOTSWITCH_MOMENTARY && mode != FOOTSWITCH_RISE && mode != FOOTSWITCH_FALL)
    {
        throw ValidationError(config_.name + ": unexpected footswitch mode");
    }
    std::string name = footswitchModeToString(mode);
    LegatoLogger::debug("{}: 设置脚踏开关模式 = {}", config_.name, name);

    transport_.exchange("ftswitch " + name, 0);
    if (getFootswitchMode() != mode)
    {
        throw PostConditionError(config_.name + ": unexpected footswitch_mode");
    }
}

int LegatoPump::getForce()
{
    std::string reply = queryLine("force");
    int64_t force = 0;
    if (!parseInt64(strip(splitOn(reply, "%")[0]), force))
    {
        throw ProtocolViolation(config_.name + ": cannot parse force (" + reply + ")");
    }
    cache_.force_pct = static_cast<int>(force);
    LegatoLogger::debug("{}: force = {}%", config_.name, cache_.force_pct);
    return cache_.force_pct;
}

void LegatoPump::setForce(int force_pct)
{
    ParameterValidator::validateForce(force_pct);
    LegatoLogger::debug("{}: 设置推力 = {}%", config_.name, force_pct);

    transport_.exchange("force " + std::to_string(force_pct), 0);
    if (getForce() != force_pct)
    {
        throw PostConditionError(config_.name + ": unexpected force_pct");
    }
}

PumpStatus LegatoPump::getStatus()
{
    std::string reply = queryLine("status");
    std::vector<std::string> tokens = splitWhitespace(reply);

    PumpStatus status;
    if (tokens.size() != 4 || tokens[3].size() < 6 ||
        !parseInt64(tokens[0], status.rate_flps) ||
        !parseInt64(tokens[1], status.time_ms) ||
        !parseInt64(tokens[2], status.volume_fl))
    {
        throw ProtocolViolation(config_.name + ": cannot parse status (" + reply + ")");
    }
    const std::string &flags = tokens[3];
    status.motor_direction = flags[0];
    status.limit_switch = flags[1];
    status.stall = flags[2];
    status.trigger_input = flags[3];
    status.direction_port = flags[4];
    status.target_reached = flags[5];

    LegatoLogger::trace("{}: current rate (fL/s)   = {}", config_.name, status.rate_flps);
    LegatoLogger::trace("{}: infuse time    (ms)   = {}", config_.name, status.time_ms);
    LegatoLogger::trace("{}: infused volume (fL)   = {}", config_.name, status.volume_fl);
    LegatoLogger::trace("{}: motor direction       = {}", config_.name, status.motor_direction);
    LegatoLogger::trace("{}: limit switch status   = {}", config_.name, status.limit_switch);
    LegatoLogger::trace("{}: stall status          = {}", config_.name, status.stall);
    LegatoLogger::trace("{}: trigger input state   = {}", config_.name, status.trigger_input);
    LegatoLogger::trace("{}: direction port state  = {}", config_.name, status.direction_port);
    LegatoLogger::trace("{}: target reached status = {}", config_.name, status.target_reached);
    return status;
}

std::pair<double, double> LegatoPump::estimateRunTime()
{
    getTargetVolume();
    if (!cache_.target_volume_set)
    {
        throw ValidationError(config_.name + ": please set a target volume");
    }
    getFlowRates();
    if (cache_.withdraw_rate_plps == 0)
    {
        throw ValidationError(config_.name + ": please set a non zero withdraw rate");
    }
    if (cache_.infuse_rate_plps == 0)
    {
        throw ValidationError(config_.name + ": please set a non zero infuse rate");
    }

    cache_.withdraw_run_time_s = roundMicros(cache_.target_volume_pl / cache_.withdraw_rate_plps);
    cache_.infuse_run_time_s = roundMicros(cache_.target_volume_pl / cache_.infuse_rate_plps);
    LegatoLogger::debug("{}: 抽取运行时间 = {} (s)", config_.name, cache_.withdraw_run_time_s);
    LegatoLogger::debug("{}: 注射运行时间 = {} (s)", config_.name, cache_.infuse_run_time_s);
    return std::make_pair(cache_.withdraw_run_time_s, cache_.infuse_run_time_s);
}

std::string LegatoPump::getSyringeType()
{
    cache_.syringe_type = queryLine("syrm");
    LegatoLogger::info("{}: 注射器类型 = {}", config_.name, cache_.syringe_type);
    return cache_.syringe_type;
}

std::pair<std::string, std::string> LegatoPump::getFlowRateLimits()
{
    std::string withdraw = queryLine("wrate lim");
    std::string infuse = queryLine("irate lim");
    LegatoLogger::info("{}: 抽取流量限值 = {}", config_.name, withdraw);
    LegatoLogger::info("{}: 注射流量限值 = {}", config_.name, infuse);

    try
    {
        cache_.withdraw_limits = ParameterValidator::parseRateLimits(withdraw);
        cache_.infuse_limits = ParameterValidator::parseRateLimits(infuse);
    }
    catch (const ProtocolViolation &e)
    {
        LegatoLogger::error("{}: {}", config_.name, e.what());
        throw ProtocolViolation(config_.name + ": " + e.what());
    }
    return std::make_pair(withdraw, infuse);
}

int64_t LegatoPump::parseRate(const std::string &reply)
{
    std::vector<std::string> tokens = splitWhitespace(reply);
    double value = 0.0;
    if (tokens.size() != 2 || !parseDouble(tokens[0], value) || !UnitConverter::isRateUnit(tokens[1]))
    {
        throw ProtocolViolation(config_.name + ": cannot parse flow rate (" + reply + ")");
    }
    return UnitConverter::toCanonicalRate(value, tokens[1]);
}

std::pair<std::string, std::string> LegatoPump::getFlowRates()
{
    std::string withdraw = queryLine("wrate");
    std::string infuse = queryLine("irate");
    LegatoLogger::info("{}: 抽取流量 = {}", config_.name, withdraw);
    LegatoLogger::info("{}: 注射流量 = {}", config_.name, infuse);

    int64_t withdraw_plps = parseRate(withdraw);
    int64_t infuse_plps = parseRate(infuse);
    cache_.withdraw_rate = withdraw;
    cache_.infuse_rate = infuse;
    cache_.withdraw_rate_plps = withdraw_plps;
    cache_.infuse_rate_plps = infuse_plps;
    return std::make_pair(withdraw, infuse);
}

const RateLimits &LegatoPump::rateLimits(RunDirection direction) const
{
    return direction == WITHDRAW ? cache_.withdraw_limits : cache_.infuse_limits;
}

void LegatoPump::setFlowRate(RunDirection direction, int64_t rate, const std::string &unit)
{
    LegatoLogger::info("{}: 设置流量 = {} {} {}", config_.name, runDirectionToString(direction), rate, unit);

    int64_t plps = ParameterValidator::checkRateWithinLimits(direction, rate, unit, rateLimits(direction));

    std::string command = fmt::format("{} {} {}", direction == WITHDRAW ? "wrate" : "irate", rate, unit);
    transport_.exchange(command, 0);

    getFlowRates();
    int64_t reported = direction == WITHDRAW ? cache_.withdraw_rate_plps : cache_.infuse_rate_plps;
    if (reported != plps)
    {
        LegatoLogger::error("{}: 请求流量 {} pl/s 未生效, 设备报告 {} pl/s", config_.name, plps, reported);
        throw PostConditionError(fmt::format("{}: requested flow rate ({}) not set ({})",
                                             config_.name, plps, reported));
    }
    LegatoLogger::info("{}: -> 流量设置完成", config_.name);
}

void LegatoPump::setFlowRate(RunDirection direction, RateBound bound)
{
    int64_t rate = 0;
    std::string unit;
    ParameterValidator::resolveRateBound(bound, rateLimits(direction), rate, unit);
    LegatoLogger::debug("{}: {} 流量 {} -> {} {}", config_.name, runDirectionToString(direction),
                        bound == RATE_MIN ? "min" : "max", rate, unit);
    setFlowRate(direction, rate, unit);
}

std::string LegatoPump::getTargetVolume()
{
    std::string reply = queryLine("tvolume");
    LegatoLogger::info("{}: 目标体积 = {}", config_.name, reply);

    if (reply == kTargetVolumeNotSet)
    {
        cache_.target_volume = reply;
        cache_.target_volume_set = false;
        cache_.target_volume_pl = 0.0;
        return reply;
    }

    std::vector<std::string> tokens = splitWhitespace(reply);
    double volume = 0.0;
    if (tokens.size() != 2 || !parseDouble(tokens[0], volume) || !UnitConverter::isVolumeUnit(tokens[1]))
    {
        throw ProtocolViolation(config_.name + ": cannot parse target volume (" + reply + ")");
    }
    cache_.target_volume = reply;
    cache_.target_volume_set = true;
    cache_.target_volume_pl = UnitConverter::toCanonicalVolume(volume, tokens[1]);
    return reply;
}

void LegatoPump::setTargetVolume(double volume, const std::string &unit)
{
    LegatoLogger::info("{}: 设置目标体积 = {} {}", config_.name, volume, unit);
    ParameterValidator::validateVolume(volume, unit);

    // 设备只接受普通小数，按实际发送的文本计算回读期望值
    std::string text = formatDecimal(volume);
    double sent = 0.0;
    if (!parseDouble(text, sent) || sent == 0.0)
    {
        throw ValidationError(fmt::format("{}: target volume too small to send ({} {})", config_.name, volume, unit));
    }
    double requested_pl = UnitConverter::toCanonicalVolume(sent, unit);
    transport_.exchange("tvolume " + text + " " + unit, 0);

    getTargetVolume();
    if (!cache_.target_volume_set ||
        std::llround(cache_.target_volume_pl) != std::llround(requested_pl))
    {
        LegatoLogger::error("{}: 目标体积未生效, 设备报告 {}", config_.name, cache_.target_volume);
        throw PostConditionError(config_.name + ": unexpected target volume (" + cache_.target_volume + ")");
    }
    LegatoLogger::info("{}: -> 目标体积设置完成", config_.name);
}

RunDirection LegatoPump::getRunDirection()
{
    std::string reply = queryLine("load");
    std::vector<std::string> tokens = splitWhitespace(reply);
    if (tokens.size() < 4 || (tokens[3] != "Withdraw" && tokens[3] != "Infuse"))
    {
        throw ProtocolViolation(config_.name + ": run direction not supported (" + reply + ")");
    }
    cache_.run_direction = tokens[3] == "Withdraw" ? WITHDRAW : INFUSE;
    LegatoLogger::info("{}: 运行方向 = {}", config_.name, runDirectionToString(cache_.run_direction));
    return cache_.run_direction;
}

void LegatoPump::setRunDirection(RunDirection direction)
{
    if (direction != WITHDRAW && direction != INFUSE)
    {
        throw ValidationError(config_.name + ": unknown run direction");
    }
    LegatoLogger::info("{}: 设置运行方向 = {}", config_.name, runDirectionToString(direction));

    transport_.exchange(direction == WITHDRAW ? "load qs w" : "load qs i", 0);
    if (getRunDirection() != direction)
    {
        throw PostConditionError(config_.name + ": unexpected run direction");
    }
    // 设备切换方向后需要额外时间才真正完成
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.direction_settle_ms));
    LegatoLogger::info("{}: -> 运行方向设置完成", config_.name);
}

void LegatoPump::run(bool block)
{
    lifecycle_.run(block);
}

void LegatoPump::finishRunning()
{
    lifecycle_.finishRunning();
}

void LegatoPump::stop()
{
    lifecycle_.stop();
}

bool LegatoPump::isRunning() const
{
    return lifecycle_.isRunning();
}

void LegatoPump::close()
{
    if (closed_)
    {
        return;
    }
    closed_ = true;
    if (!link_->isOpen())
    {
        LegatoLogger::debug("{}: 串口已关闭", config_.name);
        return;
    }
    LegatoLogger::info("{}: 正在关闭...", config_.name);
    try
    {
        link_->close();
    }
    catch (const std::exception &e)
    {
        LegatoLogger::error("{}: 关闭串口时出错: {}", config_.name, e.what());
    }
}

PumpSnapshot LegatoPump::snapshot() const
{
    PumpSnapshot snapshot = cache_;
    snapshot.running = lifecycle_.isRunning();
    return snapshot;
}
