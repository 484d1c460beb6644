#include "parameter_validator.hpp"
#include "pump_errors.hpp"
#include "reply_parser.hpp"
#include "unit_converter.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

RunDirection ParameterValidator::parseRunDirection(const std::string &text)
{
    if (text == "withdraw")
    {
        return WITHDRAW;
    }
    if (text == "infuse")
    {
        return INFUSE;
    }
    throw ValidationError("unknown run direction (" + text + ")");
}

FootswitchMode ParameterValidator::parseFootswitchMode(const std::string &text)
{
    if (text == "mom")
    {
        return FOOTSWITCH_MOMENTARY;
    }
    if (text == "rise")
    {
        return FOOTSWITCH_RISE;
    }
    if (text == "fall")
    {
        return FOOTSWITCH_FALL;
    }
    throw ValidationError("unexpected footswitch mode (" + text + ")");
}

void ParameterValidator::validateForce(int force_pct)
{
    if (force_pct < 1 || force_pct > 100)
    {
        throw ValidationError(fmt::format("force_pct out of range ({})", force_pct));
    }
}

void ParameterValidator::validateVolume(double volume, const std::string &unit)
{
    if (!std::isfinite(volume))
    {
        throw ValidationError("target volume must be a finite number");
    }
    if (volume == 0.0)
    {
        throw ValidationError("zero target volume not allowed");
    }
    if (!UnitConverter::isVolumeUnit(unit))
    {
        throw ValidationError("unexpected unit for volume (" + unit + ")");
    }
}

void ParameterValidator::validateRate(int64_t rate, const std::string &unit)
{
    if (rate == 0)
    {
        throw ValidationError("zero flow rate not allowed");
    }
    if (!UnitConverter::isRateUnit(unit))
    {
        throw ValidationError("unexpected unit for flow rate (" + unit + ")");
    }
}

void ParameterValidator::resolveRateBound(RateBound bound, const RateLimits &limits, int64_t &rate,
                                          std::string &unit)
{
    double value = bound == RATE_MIN ? limits.min : limits.max;
    std::string current = bound == RATE_MIN ? limits.min_unit : limits.max_unit;

    while (true)
    {
        double nearest = std::round(value);
        if (std::fabs(value - nearest) <= 1e-9 * std::max(1.0, std::fabs(value)))
        {
            rate = static_cast<int64_t>(nearest);
            unit = current;
            return;
        }
        std::string finer;
        if (!UnitConverter::finerRateUnit(current, finer))
        {
            break;
        }
        value *= 1000.0;
        current = finer;
    }

    rate = static_cast<int64_t>(bound == RATE_MIN ? std::ceil(value) : std::floor(value));
    unit = current;
}

int64_t ParameterValidator::checkRateWithinLimits(RunDirection direction, int64_t rate, const std::string &unit,
                                                  const RateLimits &limits)
{
    validateRate(rate, unit);
    int64_t plps = UnitConverter::toCanonicalRate(static_cast<double>(rate), unit);
    if (plps < limits.min_plps)
    {
        throw ValidationError(fmt::format("{} flow rate ({} {}) too low (min {} {})",
                                          runDirectionToString(direction), rate, unit,
                                          limits.min, limits.min_unit));
    }
    if (plps > limits.max_plps)
    {
        throw ValidationError(fmt::format("{} flow rate ({} {}) too high (max {} {})",
                                          runDirectionToString(direction), rate, unit,
                                          limits.max, limits.max_unit));
    }
    return plps;
}

RateLimits ParameterValidator::parseRateLimits(const std::string &raw)
{
    RateLimits limits;
    limits.raw = raw;

    std::vector<std::string> parts = splitOn(raw, " to ");
    if (parts.size() != 2)
    {
        throw ProtocolViolation("cannot parse flow rate limits (" + raw + ")");
    }
    std::vector<std::string> low = splitWhitespace(parts[0]);
    std::vector<std::string> high = splitWhitespace(parts[1]);
    if (low.size() != 2 || high.size() != 2 ||
        !parseDouble(low[0], limits.min) || !parseDouble(high[0], limits.max) ||
        !UnitConverter::isRateUnit(low[1]) || !UnitConverter::isRateUnit(high[1]))
    {
        throw ProtocolViolation("cannot parse flow rate limits (" + raw + ")");
    }
    limits.min_unit = low[1];
    limits.max_unit = high[1];
    limits.min_plps = UnitConverter::toCanonicalRate(limits.min, limits.min_unit);
    limits.max_plps = UnitConverter::toCanonicalRate(limits.max, limits.max_unit);
    return limits;
}
