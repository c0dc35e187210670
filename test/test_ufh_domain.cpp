#include <cstring>

#include <gtest/gtest.h>

#include "UFHDomain.h"

using ConfigErr = UFHDomain::ConfigErr;
using ControllerConfig = UFHDomain::ControllerConfig;
using OperationMode = UFHDomain::OperationMode;
using TimePoint = UFHDomain::TimePoint;

// 2024-01-15 00:00:00 UTC
static const TimePoint midnight = TimePoint(std::chrono::seconds(1705276800));

TEST(ObservationStartTest, AlignsToMidnight) {
    std::chrono::seconds period = std::chrono::hours(2);

    EXPECT_EQ(UFHDomain::getObservationStart(midnight, period), midnight);
    EXPECT_EQ(UFHDomain::getObservationStart(midnight + std::chrono::minutes(119), period),
              midnight);
    EXPECT_EQ(UFHDomain::getObservationStart(midnight + std::chrono::hours(9) +
                                                 std::chrono::milliseconds(1500),
                                             period),
              midnight + std::chrono::hours(8));
    EXPECT_EQ(UFHDomain::getObservationStart(midnight + std::chrono::seconds(86399), period),
              midnight + std::chrono::hours(22));
}

TEST(ObservationStartTest, UnevenPeriodRestartsAtMidnight) {
    std::chrono::seconds period = std::chrono::hours(5);

    EXPECT_EQ(UFHDomain::getObservationStart(midnight + std::chrono::hours(23), period),
              midnight + std::chrono::hours(20));
    EXPECT_EQ(UFHDomain::getObservationStart(midnight + std::chrono::hours(25), period),
              midnight + std::chrono::hours(24));
}

class ValidateConfigTest : public testing::Test {
  protected:
    void SetUp() override {
        config_.id = "ufh";
        config_.zones.push_back(UFHDomain::ZoneConfig{.id = "living"});
        config_.zones.push_back(UFHDomain::ZoneConfig{.id = "bath"});
    }

    ControllerConfig config_;
};

TEST_F(ValidateConfigTest, DefaultsAreValid) {
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::None);
    EXPECT_EQ(UFHDomain::validateConfig(ControllerConfig{}), ConfigErr::None);
}

TEST_F(ValidateConfigTest, Timing) {
    config_.timing.flushDuration = std::chrono::seconds(0);
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::Timing);

    config_.timing = UFHDomain::TimingParams{};
    config_.timing.minRunTime = std::chrono::hours(2);
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::MinRunTime);

    config_.timing = UFHDomain::TimingParams{};
    config_.health.failSafeTimeout = std::chrono::seconds(-1);
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::HealthTimeout);
}

TEST_F(ValidateConfigTest, Thresholds) {
    config_.valveOpenThreshold = 1.2;
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::Threshold);
}

TEST_F(ValidateConfigTest, ZoneIDs) {
    config_.zones.push_back(UFHDomain::ZoneConfig{.id = "living"});
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::DuplicateZoneID);

    config_.zones.back().id = "";
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::NoZoneID);
}

TEST_F(ValidateConfigTest, ZoneLimits) {
    config_.zones[0].setpoint.defaultC = 30.0;
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::SetpointLimits);

    config_.zones[0].setpoint = UFHDomain::SetpointLimits{};
    config_.zones[0].pid.integralMin = 50.0;
    config_.zones[0].pid.integralMax = 10.0;
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::IntegralLimits);

    config_.zones[0].pid = UFHDomain::PIDGains{};
    config_.zones[0].emaTauS = -1;
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::EMATau);

    config_.zones[0].emaTauS = 0;
    config_.zones[0].setpoint.minC = 18.0;
    // The default away preset is below the new minimum
    EXPECT_EQ(UFHDomain::validateConfig(config_), ConfigErr::PresetSetpoint);
}

TEST(SetpointLimitsTest, Clamp) {
    UFHDomain::SetpointLimits limits;

    EXPECT_DOUBLE_EQ(limits.clamp(10.0), 16.0);
    EXPECT_DOUBLE_EQ(limits.clamp(21.5), 21.5);
    EXPECT_DOUBLE_EQ(limits.clamp(31.0), 28.0);
}

TEST(OperationModeTest, StringRoundTrip) {
    OperationMode modes[] = {OperationMode::Auto,  OperationMode::Flush,  OperationMode::Cycle,
                             OperationMode::AllOn, OperationMode::AllOff, OperationMode::Disabled};
    for (OperationMode mode : modes) {
        OperationMode parsed = OperationMode::Disabled;
        ASSERT_TRUE(UFHDomain::operationModeFromS(UFHDomain::operationModeToS(mode), &parsed));
        EXPECT_EQ(parsed, mode);
    }

    OperationMode parsed = OperationMode::Auto;
    EXPECT_FALSE(UFHDomain::operationModeFromS("turbo", &parsed));
    EXPECT_EQ(parsed, OperationMode::Auto);
}

TEST(DomainStringsTest, StableNames) {
    EXPECT_STREQ(UFHDomain::valveActionToS(UFHDomain::ValveAction::TurnOn), "turn_on");
    EXPECT_STREQ(UFHDomain::secondaryModeToS(UFHDomain::SecondaryMode::Winter), "winter");
    EXPECT_STREQ(UFHDomain::zoneStatusToS(UFHDomain::ZoneStatus::FailSafe), "fail_safe");
    EXPECT_STREQ(UFHDomain::controllerStatusToS(UFHDomain::ControllerStatus::Degraded),
                 "degraded");
    EXPECT_STREQ(UFHDomain::valveStateToS(UFHDomain::ValveState::Unavailable), "unavailable");
    EXPECT_STREQ(UFHDomain::msgIDToS(UFHDomain::MsgID::ZoneFailSafe), "ZoneFailSafe");
    EXPECT_STREQ(UFHDomain::configErrToS(ConfigErr::None), "ok");
    EXPECT_STREQ(UFHDomain::circuitTypeToS(UFHDomain::CircuitType::Regular), "regular");
    EXPECT_STREQ(UFHDomain::circuitTypeToS(UFHDomain::CircuitType::Flush), "flush");
}
