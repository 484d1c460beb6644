#include <gtest/gtest.h>
#include "fake_legato.hpp"
#include "pump_errors.hpp"

TEST(LegatoPumpTest, HandshakeReadsDeviceState) {
    FakeLegato legato;
    EXPECT_EQ(legato.link->pendingExpectations(), 0u);
    EXPECT_EQ(legato.link->unreadBytes(), 0u);

    PumpSnapshot s = legato.pump->snapshot();
    EXPECT_EQ(s.version, "Legato 110 3.0.6");
    ASSERT_EQ(s.version_long.size(), 3u);
    EXPECT_EQ(s.syringe_type, "bdp 4.699 mm 1 ml");
    EXPECT_EQ(s.force_pct, 50);
    EXPECT_EQ(s.footswitch_mode, FOOTSWITCH_FALL);
    EXPECT_EQ(s.run_direction, INFUSE);
    EXPECT_TRUE(s.target_volume_set);
    EXPECT_DOUBLE_EQ(s.target_volume_pl, 1e9);
    EXPECT_EQ(s.withdraw_limits.min_plps, 19);
    EXPECT_EQ(s.infuse_limits.max_plps, 25000000);
    EXPECT_EQ(s.withdraw_rate, "1 ml/min");
    EXPECT_NEAR(s.withdraw_run_time_s, 60.0, 1e-5);
    EXPECT_NEAR(s.infuse_run_time_s, 30.0, 1e-5);
    EXPECT_FALSE(s.running);
}

TEST(LegatoPumpTest, EchoEnabledIsProtocolViolation) {
    HandshakeReplies r;
    r.echo = "ON";
    EXPECT_THROW(FakeLegato legato(r), ProtocolViolation);
}

TEST(LegatoPumpTest, NonZeroAddressIsProtocolViolation) {
    HandshakeReplies r;
    r.addr = "Pump address is 3";
    EXPECT_THROW(FakeLegato legato(r), ProtocolViolation);
}

TEST(LegatoPumpTest, WrongModelIsConnectivityError) {
    HandshakeReplies r;
    r.ver = "Legato 200 3.0.6";
    EXPECT_THROW(FakeLegato legato(r), ConnectivityError);
}

TEST(LegatoPumpTest, FailedHandshakeClosesLink) {
    int closes = 0;
    auto owned = std::make_unique<FakeSerialLink>();
    owned->trackCloses(&closes);
    HandshakeReplies r;
    r.poll = "ON";
    scriptHandshake(*owned, r);
    EXPECT_THROW(LegatoPump pump(std::move(owned), testConfig()), ProtocolViolation);
    EXPECT_EQ(closes, 1);
}

TEST(LegatoPumpTest, FootswitchReadBackMismatchIsPostConditionError) {
    HandshakeReplies r;
    r.ftswitch = "Active high";
    EXPECT_THROW(FakeLegato legato(r), PostConditionError);
}

TEST(LegatoPumpTest, UnsetTargetVolumeFailsRunTimeEstimate) {
    HandshakeReplies r;
    r.tvolume = "Target volume not set";
    EXPECT_THROW(FakeLegato legato(r), ValidationError);
}

TEST(LegatoPumpTest, ParsesStatusWord) {
    FakeLegato legato;
    legato.link->expect("status", reply("2778 1200 3333 iL.T.T"));
    PumpStatus status = legato.pump->getStatus();
    EXPECT_EQ(status.rate_flps, 2778);
    EXPECT_EQ(status.time_ms, 1200);
    EXPECT_EQ(status.volume_fl, 3333);
    EXPECT_EQ(status.motor_direction, 'i');
    EXPECT_EQ(status.limit_switch, 'L');
    EXPECT_EQ(status.stall, '.');
    EXPECT_EQ(status.trigger_input, 'T');
    EXPECT_EQ(status.target_reached, 'T');

    legato.link->expect("status", reply("0 0 i....."));
    EXPECT_THROW(legato.pump->getStatus(), ProtocolViolation);
}

TEST(LegatoPumpTest, MinimumRateUsesFinerUnit) {
    FakeLegato legato;
    legato.link->expect("wrate 1140 pl/min", reply());
    legato.link->expect("wrate", reply("1.14 nl/min"));
    legato.link->expect("irate", reply("2 ml/min"));

    legato.pump->setFlowRate(WITHDRAW, RATE_MIN);

    EXPECT_EQ(legato.link->pendingExpectations(), 0u);
    EXPECT_EQ(legato.pump->snapshot().withdraw_rate_plps, 19);
}

TEST(LegatoPumpTest, MaximumRate) {
    FakeLegato legato;
    legato.link->expect("irate 1500 ul/min", reply());
    legato.link->expect("wrate", reply("1 ml/min"));
    legato.link->expect("irate", reply("1.5 ml/min"));

    legato.pump->setFlowRate(INFUSE, RATE_MAX);
    EXPECT_EQ(legato.pump->snapshot().infuse_rate, "1.5 ml/min");
}

TEST(LegatoPumpTest, RateOutsideLimitsIsRejectedBeforeSending) {
    FakeLegato legato;
    size_t written = legato.link->written().size();

    EXPECT_THROW(legato.pump->setFlowRate(WITHDRAW, 18, "pl/sec"), ValidationError);
    EXPECT_THROW(legato.pump->setFlowRate(INFUSE, 2, "ml/min"), ValidationError);
    EXPECT_THROW(legato.pump->setFlowRate(INFUSE, 0, "ul/min"), ValidationError);
    EXPECT_THROW(legato.pump->setFlowRate(INFUSE, 10, "ul/day"), ValidationError);

    EXPECT_EQ(legato.link->written().size(), written);
}

TEST(LegatoPumpTest, RateReadBackMismatchIsPostConditionError) {
    FakeLegato legato;
    legato.link->expect("irate 100 ul/min", reply());
    legato.link->expect("wrate", reply("1 ml/min"));
    legato.link->expect("irate", reply("99 ul/min"));

    EXPECT_THROW(legato.pump->setFlowRate(INFUSE, 100, "ul/min"), PostConditionError);
}

TEST(LegatoPumpTest, ZeroTargetVolumeRejectedInEveryUnit) {
    FakeLegato legato;
    size_t written = legato.link->written().size();
    for (const char* unit : {"ml", "ul", "nl", "pl"}) {
        EXPECT_THROW(legato.pump->setTargetVolume(0, unit), ValidationError) << unit;
    }
    EXPECT_EQ(legato.link->written().size(), written);
}

TEST(LegatoPumpTest, TargetVolumeReadBackIsComparedCanonically) {
    FakeLegato legato;
    legato.link->expect("tvolume 1 ul", reply());
    legato.link->expect("tvolume", reply("1000 nl"));
    EXPECT_NO_THROW(legato.pump->setTargetVolume(1, "ul"));

    legato.link->expect("tvolume 1 ul", reply());
    legato.link->expect("tvolume", reply("2 ul"));
    EXPECT_THROW(legato.pump->setTargetVolume(1, "ul"), PostConditionError);
}

TEST(LegatoPumpTest, SetRunDirection) {
    FakeLegato legato;
    legato.link->expect("load qs w", reply());
    legato.link->expect("load", reply("Quick start - Withdraw only"));

    legato.pump->setRunDirection(WITHDRAW);
    EXPECT_EQ(legato.pump->snapshot().run_direction, WITHDRAW);

    legato.link->expect("load", reply("Method - custom"));
    EXPECT_THROW(legato.pump->getRunDirection(), ProtocolViolation);
}

TEST(LegatoPumpTest, SetForceVerifiesReadBack) {
    FakeLegato legato;
    legato.link->expect("force 80", reply());
    legato.link->expect("force", reply("80%"));
    legato.pump->setForce(80);
    EXPECT_EQ(legato.pump->snapshot().force_pct, 80);

    EXPECT_THROW(legato.pump->setForce(0), ValidationError);
}

TEST(LegatoPumpTest, CompletionRaceDoesNotChangeQueryResults) {
    FakeLegato raced;
    raced.link->expect("run", reply(std::vector<std::string>{}, ">"));
    raced.link->expect("syrm", reply("bdp 4.699 mm 1 ml"));

    FakeLegato calm;
    calm.link->expect("run", reply(std::vector<std::string>{}, ">"));
    calm.link->expect("syrm", reply("bdp 4.699 mm 1 ml"));
    calm.link->completeWhenWaited();

    raced.pump->run(false);
    calm.pump->run(false);
    raced.link->completeOnNextReply();
    std::string racedType = raced.pump->getSyringeType();
    std::string calmType = calm.pump->getSyringeType();
    EXPECT_EQ(racedType, calmType);

    EXPECT_FALSE(raced.pump->isRunning());
    EXPECT_TRUE(calm.pump->isRunning());

    for (LegatoPump* pump : {raced.pump.get(), calm.pump.get()}) {
        if (pump->isRunning()) {
            pump->finishRunning();
        }
        EXPECT_FALSE(pump->isRunning());
    }
    EXPECT_EQ(raced.link->unreadBytes(), 0u);
    EXPECT_EQ(calm.link->unreadBytes(), 0u);
}

TEST(LegatoPumpTest, BlockingRunAndStop) {
    FakeLegato legato;
    legato.link->expect("run", reply(std::vector<std::string>{}, ">"));
    legato.link->completeWhenWaited();
    legato.pump->run();
    EXPECT_FALSE(legato.pump->isRunning());

    legato.link->expect("run", reply(std::vector<std::string>{}, ">"));
    legato.link->expect("stop", reply());
    legato.pump->run(false);
    EXPECT_TRUE(legato.pump->snapshot().running);
    legato.pump->stop();
    EXPECT_FALSE(legato.pump->isRunning());
}

TEST(LegatoPumpTest, CloseIsIdempotent) {
    int closes = 0;
    FakeLegato legato;
    legato.link->trackCloses(&closes);

    legato.pump->close();
    legato.pump->close();
    EXPECT_EQ(closes, 1);
    EXPECT_THROW(legato.pump->getSyringeType(), ConnectivityError);

    legato.pump.reset();
    EXPECT_EQ(closes, 1);
}

TEST(LegatoPumpTest, SmallTargetVolumeIsSentAsPlainDecimal) {
    FakeLegato legato;
    legato.link->expect("tvolume 0.00001 ml", reply());
    legato.link->expect("tvolume", reply("10 nl"));
    EXPECT_NO_THROW(legato.pump->setTargetVolume(1e-5, "ml"));

    size_t written = legato.link->written().size();
    EXPECT_THROW(legato.pump->setTargetVolume(1e-12, "ml"), ValidationError);
    EXPECT_EQ(legato.link->written().size(), written);
}

TEST(LegatoPumpTest, MalformedRateLimitsNameTheDevice) {
    HandshakeReplies r;
    r.irateLim = "1.14 nl/min up to 1.5 ml/min";
    try {
        FakeLegato legato(r);
        FAIL() << "expected ProtocolViolation";
    } catch (const ProtocolViolation& e) {
        std::string message = e.what();
        EXPECT_EQ(message.find("Legato110: "), 0u) << message;
        EXPECT_NE(message.find("up to"), std::string::npos) << message;
    }
}

TEST(LegatoPumpTest, CloseAfterLinkAlreadyClosed) {
    int closes = 0;
    FakeLegato legato;
    legato.link->trackCloses(&closes);
    legato.link->close();

    EXPECT_NO_THROW(legato.pump->close());
    EXPECT_EQ(closes, 1);
}

TEST(LegatoPumpTest, StopAnsweredAfterLateCompletionKeepsLinkInSync) {
    FakeLegato legato;
    legato.link->expect("run", reply(std::vector<std::string>{}, ">"));
    legato.link->expect("stop", "\nT*");
    legato.link->expect("syrm", reply("bdp 4.699 mm 1 ml"));

    legato.pump->run(false);
    legato.link->replyLater("\n:");
    legato.pump->stop();

    EXPECT_FALSE(legato.pump->isRunning());
    EXPECT_EQ(legato.pump->getSyringeType(), "bdp 4.699 mm 1 ml");
    EXPECT_EQ(legato.link->unreadBytes(), 0u);
}
