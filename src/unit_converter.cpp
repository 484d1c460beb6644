#include "unit_converter.hpp"
#include "pump_errors.hpp"
#include <cmath>
#include <set>

namespace
{
    const UnitConverter::VolumeUnit kVolumeUnits[] = {
        {"ml", 1000000000LL},
        {"ul", 1000000LL},
        {"nl", 1000LL},
        {"pl", 1LL},
    };

    struct TimeUnit
    {
        const char *name;
        int64_t seconds;
    };

    const TimeUnit kTimeUnits[] = {
        {"hr", 3600},
        {"min", 60},
        {"sec", 1},
    };

    // 设备接受的全部流量单位
    const UnitConverter::RateUnit kRateUnits[] = {
        {"ml/hr", 1000000000LL, 3600},
        {"ul/hr", 1000000LL, 3600},
        {"nl/hr", 1000LL, 3600},
        {"pl/hr", 1LL, 3600},
        {"ml/min", 1000000000LL, 60},
        {"ul/min", 1000000LL, 60},
        {"nl/min", 1000LL, 60},
        {"pl/min", 1LL, 60},
        {"ml/sec", 1000000000LL, 1},
        {"ul/sec", 1000000LL, 1},
        {"nl/sec", 1000LL, 1},
        {"pl/sec", 1LL, 1},
    };
}

const UnitConverter::RateUnit *UnitConverter::findRateUnit(const std::string &unit)
{
    for (const auto &entry : kRateUnits)
    {
        if (unit == entry.name)
        {
            return &entry;
        }
    }
    return nullptr;
}

const UnitConverter::VolumeUnit *UnitConverter::findVolumeUnit(const std::string &unit)
{
    for (const auto &entry : kVolumeUnits)
    {
        if (unit == entry.name)
        {
            return &entry;
        }
    }
    return nullptr;
}

int64_t UnitConverter::toCanonicalRate(double value, const std::string &unit)
{
    const RateUnit *entry = findRateUnit(unit);
    if (!entry)
    {
        throw ValidationError("unexpected unit for flow rate (" + unit + ")");
    }
    long double plps = static_cast<long double>(value) * entry->pl_per_volume / entry->seconds_per_time;
    return static_cast<int64_t>(std::llround(plps));
}

double UnitConverter::fromCanonicalRate(int64_t plps, const std::string &unit)
{
    const RateUnit *entry = findRateUnit(unit);
    if (!entry)
    {
        throw ValidationError("unexpected unit for flow rate (" + unit + ")");
    }
    long double value = static_cast<long double>(plps) * entry->seconds_per_time / entry->pl_per_volume;
    return static_cast<double>(value);
}

double UnitConverter::toCanonicalVolume(double value, const std::string &unit)
{
    const VolumeUnit *entry = findVolumeUnit(unit);
    if (!entry)
    {
        throw ValidationError("unexpected unit for volume (" + unit + ")");
    }
    return static_cast<double>(static_cast<long double>(value) * entry->pl);
}

bool UnitConverter::isRateUnit(const std::string &unit)
{
    return findRateUnit(unit) != nullptr;
}

bool UnitConverter::isVolumeUnit(const std::string &unit)
{
    return findVolumeUnit(unit) != nullptr;
}

std::vector<std::string> UnitConverter::rateUnits()
{
    std::vector<std::string> names;
    for (const auto &entry : kRateUnits)
    {
        names.emplace_back(entry.name);
    }
    return names;
}

std::vector<std::string> UnitConverter::volumeUnits()
{
    std::vector<std::string> names;
    for (const auto &entry : kVolumeUnits)
    {
        names.emplace_back(entry.name);
    }
    return names;
}

bool UnitConverter::finerRateUnit(const std::string &unit, std::string &finer)
{
    const RateUnit *entry = findRateUnit(unit);
    if (!entry)
    {
        throw ValidationError("unexpected unit for flow rate (" + unit + ")");
    }
    for (const auto &candidate : kRateUnits)
    {
        if (candidate.seconds_per_time == entry->seconds_per_time &&
            candidate.pl_per_volume * 1000 == entry->pl_per_volume)
        {
            finer = candidate.name;
            return true;
        }
    }
    return false;
}

void UnitConverter::verifyUnitTables()
{
    std::set<std::string> seen;
    for (const auto &entry : kRateUnits)
    {
        if (!seen.insert(entry.name).second)
        {
            throw InvariantViolation(std::string("duplicate flow rate unit: ") + entry.name);
        }
    }

    for (const auto &volume : kVolumeUnits)
    {
        for (const auto &time : kTimeUnits)
        {
            std::string name = std::string(volume.name) + "/" + time.name;
            const RateUnit *entry = findRateUnit(name);
            if (!entry)
            {
                throw InvariantViolation("missing flow rate unit: " + name);
            }
            if (entry->pl_per_volume != volume.pl || entry->seconds_per_time != time.seconds)
            {
                throw InvariantViolation("wrong conversion factor for flow rate unit: " + name);
            }
        }
    }

    if (seen.size() != (sizeof(kVolumeUnits) / sizeof(kVolumeUnits[0])) * (sizeof(kTimeUnits) / sizeof(kTimeUnits[0])))
    {
        throw InvariantViolation("flow rate unit table has unexpected entries");
    }
}
