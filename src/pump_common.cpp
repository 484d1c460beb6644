#include "pump_common.hpp"

std::string runDirectionToString(RunDirection direction)
{
    return direction == WITHDRAW ? "withdraw" : "infuse";
}

std::string footswitchModeToString(FootswitchMode mode)
{
    switch (mode)
    {
    case FOOTSWITCH_MOMENTARY:
        return "mom";
    case FOOTSWITCH_RISE:
        return "rise";
    case FOOTSWITCH_FALL:
        return "fall";
    default:
        return "unknown";
    }
}
