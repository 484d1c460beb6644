#include <gtest/gtest.h>
#include "parameter_validator.hpp"
#include "pump_errors.hpp"

namespace {

RateLimits defaultLimits() {
    return ParameterValidator::parseRateLimits("1.14 nl/min to 1.5 ml/min");
}

} // namespace

TEST(ParameterValidatorTest, ForceRange) {
    EXPECT_THROW(ParameterValidator::validateForce(0), ValidationError);
    EXPECT_THROW(ParameterValidator::validateForce(101), ValidationError);
    EXPECT_NO_THROW(ParameterValidator::validateForce(1));
    EXPECT_NO_THROW(ParameterValidator::validateForce(100));
}

TEST(ParameterValidatorTest, ZeroVolumeRejectedForEveryUnit) {
    for (const char* unit : {"ml", "ul", "nl", "pl"}) {
        EXPECT_THROW(ParameterValidator::validateVolume(0.0, unit), ValidationError) << unit;
    }
    EXPECT_NO_THROW(ParameterValidator::validateVolume(2.5, "ul"));
}

TEST(ParameterValidatorTest, VolumeUnitMustBeKnown) {
    EXPECT_THROW(ParameterValidator::validateVolume(1.0, "l"), ValidationError);
    EXPECT_THROW(ParameterValidator::validateVolume(1.0, "ml/min"), ValidationError);
}

TEST(ParameterValidatorTest, RateChecks) {
    EXPECT_THROW(ParameterValidator::validateRate(0, "ul/min"), ValidationError);
    EXPECT_THROW(ParameterValidator::validateRate(5, "ul/day"), ValidationError);
    EXPECT_NO_THROW(ParameterValidator::validateRate(5, "ul/min"));
}

TEST(ParameterValidatorTest, ParsesDirectionsAndFootswitchModes) {
    EXPECT_EQ(ParameterValidator::parseRunDirection("withdraw"), WITHDRAW);
    EXPECT_EQ(ParameterValidator::parseRunDirection("infuse"), INFUSE);
    EXPECT_THROW(ParameterValidator::parseRunDirection("Infuse"), ValidationError);

    EXPECT_EQ(ParameterValidator::parseFootswitchMode("mom"), FOOTSWITCH_MOMENTARY);
    EXPECT_EQ(ParameterValidator::parseFootswitchMode("rise"), FOOTSWITCH_RISE);
    EXPECT_EQ(ParameterValidator::parseFootswitchMode("fall"), FOOTSWITCH_FALL);
    EXPECT_THROW(ParameterValidator::parseFootswitchMode("toggle"), ValidationError);
}

TEST(ParameterValidatorTest, ParsesRateLimits) {
    RateLimits limits = defaultLimits();
    EXPECT_EQ(limits.raw, "1.14 nl/min to 1.5 ml/min");
    EXPECT_DOUBLE_EQ(limits.min, 1.14);
    EXPECT_EQ(limits.min_unit, "nl/min");
    EXPECT_DOUBLE_EQ(limits.max, 1.5);
    EXPECT_EQ(limits.max_unit, "ml/min");
    EXPECT_EQ(limits.min_plps, 19);
    EXPECT_EQ(limits.max_plps, 25000000);
}

TEST(ParameterValidatorTest, MalformedRateLimitsAreProtocolViolations) {
    EXPECT_THROW(ParameterValidator::parseRateLimits("1.14 nl/min"), ProtocolViolation);
    EXPECT_THROW(ParameterValidator::parseRateLimits("1.14 nl/min - 1.5 ml/min"), ProtocolViolation);
    EXPECT_THROW(ParameterValidator::parseRateLimits("low nl/min to 1.5 ml/min"), ProtocolViolation);
    EXPECT_THROW(ParameterValidator::parseRateLimits("1.14 nl/day to 1.5 ml/min"), ProtocolViolation);
}

TEST(ParameterValidatorTest, FractionalMinimumMovesToFinerUnit) {
    int64_t rate = 0;
    std::string unit;
    ParameterValidator::resolveRateBound(RATE_MIN, defaultLimits(), rate, unit);
    EXPECT_EQ(rate, 1140);
    EXPECT_EQ(unit, "pl/min");
}

TEST(ParameterValidatorTest, FractionalMaximumMovesToFinerUnit) {
    int64_t rate = 0;
    std::string unit;
    ParameterValidator::resolveRateBound(RATE_MAX, defaultLimits(), rate, unit);
    EXPECT_EQ(rate, 1500);
    EXPECT_EQ(unit, "ul/min");
}

TEST(ParameterValidatorTest, IntegralBoundKeepsItsUnit) {
    RateLimits limits = ParameterValidator::parseRateLimits("3 nl/hr to 100 ml/hr");
    int64_t rate = 0;
    std::string unit;
    ParameterValidator::resolveRateBound(RATE_MAX, limits, rate, unit);
    EXPECT_EQ(rate, 100);
    EXPECT_EQ(unit, "ml/hr");
}

TEST(ParameterValidatorTest, SubPicolitreBoundsRoundInward) {
    RateLimits limits = ParameterValidator::parseRateLimits("0.5 pl/sec to 0.5 pl/sec");
    int64_t rate = 0;
    std::string unit;

    ParameterValidator::resolveRateBound(RATE_MIN, limits, rate, unit);
    EXPECT_EQ(rate, 1);
    EXPECT_EQ(unit, "pl/sec");

    ParameterValidator::resolveRateBound(RATE_MAX, limits, rate, unit);
    EXPECT_EQ(rate, 0);
    EXPECT_EQ(unit, "pl/sec");
}

TEST(ParameterValidatorTest, RateBelowMinimumNamesTheBound) {
    try {
        ParameterValidator::checkRateWithinLimits(WITHDRAW, 18, "pl/sec", defaultLimits());
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("withdraw"), std::string::npos) << message;
        EXPECT_NE(message.find("too low"), std::string::npos) << message;
        EXPECT_NE(message.find("nl/min"), std::string::npos) << message;
    }
}

TEST(ParameterValidatorTest, RateAboveMaximumNamesTheBound) {
    try {
        ParameterValidator::checkRateWithinLimits(INFUSE, 2, "ml/min", defaultLimits());
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("infuse"), std::string::npos) << message;
        EXPECT_NE(message.find("too high"), std::string::npos) << message;
    }
}

TEST(ParameterValidatorTest, RateAtLimitsIsAccepted) {
    EXPECT_EQ(ParameterValidator::checkRateWithinLimits(WITHDRAW, 1140, "pl/min", defaultLimits()), 19);
    EXPECT_EQ(ParameterValidator::checkRateWithinLimits(INFUSE, 1500, "ul/min", defaultLimits()), 25000000);
    EXPECT_EQ(ParameterValidator::checkRateWithinLimits(INFUSE, 19, "pl/sec", defaultLimits()), 19);
}
