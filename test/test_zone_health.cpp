#include <gtest/gtest.h>

#include "ZoneHealth.h"

using ControllerStatus = UFHDomain::ControllerStatus;
using HealthTransition = UFHDomain::HealthTransition;
using TimePoint = UFHDomain::TimePoint;
using ZoneStatus = UFHDomain::ZoneStatus;

class ZoneHealthTest : public testing::Test {
  protected:
    HealthUpdate succeed() { return updateZoneHealth(zone_, now_, false, false, false, params_); }
    HealthUpdate fail() { return updateZoneHealth(zone_, now_, false, true, false, params_); }
    void incrTime(std::chrono::seconds t) { now_ += t; }

    UFHDomain::HealthParams params_;
    UFHDomain::ZoneState zone_;
    TimePoint now_ = TimePoint(std::chrono::hours(24 * 365 * 55));
};

TEST_F(ZoneHealthTest, FirstSuccessInitializes) {
    EXPECT_EQ(zone_.status, ZoneStatus::Initializing);

    HealthUpdate update = succeed();

    EXPECT_EQ(update.transition, HealthTransition::Initialized);
    EXPECT_EQ(zone_.status, ZoneStatus::Normal);
    EXPECT_EQ(zone_.lastSuccessfulUpdate, now_);
    EXPECT_EQ(succeed().transition, HealthTransition::None);
}

TEST_F(ZoneHealthTest, AnySignalCountsAsFailure) {
    succeed();

    EXPECT_EQ(updateZoneHealth(zone_, now_, true, false, false, params_).transition,
              HealthTransition::EnteredDegraded);
    EXPECT_EQ(updateZoneHealth(zone_, now_, false, false, true, params_).transition,
              HealthTransition::None);
    EXPECT_EQ(zone_.consecutiveFailures, 2);
}

TEST_F(ZoneHealthTest, NeverNormalFailsAtInitializingTimeout) {
    HealthUpdate update = fail();
    EXPECT_EQ(update.transition, HealthTransition::None);
    EXPECT_EQ(update.timeoutUsed, params_.initializingTimeout);
    EXPECT_EQ(zone_.status, ZoneStatus::Initializing);

    incrTime(params_.initializingTimeout);
    EXPECT_EQ(fail().transition, HealthTransition::None);
    EXPECT_EQ(zone_.status, ZoneStatus::Initializing);

    incrTime(std::chrono::seconds(1));
    update = fail();
    EXPECT_EQ(update.transition, HealthTransition::EnteredFailSafe);
    EXPECT_EQ(update.timeoutUsed, params_.initializingTimeout);
    EXPECT_EQ(zone_.status, ZoneStatus::FailSafe);
    EXPECT_FALSE(zone_.lastSuccessfulUpdate.has_value());
}

TEST_F(ZoneHealthTest, NormalZoneDegradesThenFailsAtFailSafeTimeout) {
    succeed();
    TimePoint lastGood = now_;

    incrTime(std::chrono::seconds(60));
    EXPECT_EQ(fail().transition, HealthTransition::EnteredDegraded);
    EXPECT_EQ(zone_.status, ZoneStatus::Degraded);

    // Well past the initializing timeout, still only degraded
    incrTime(std::chrono::minutes(30));
    HealthUpdate update = fail();
    EXPECT_EQ(update.transition, HealthTransition::None);
    EXPECT_EQ(update.timeoutUsed, params_.failSafeTimeout);
    EXPECT_EQ(zone_.status, ZoneStatus::Degraded);

    now_ = lastGood + params_.failSafeTimeout;
    EXPECT_EQ(fail().transition, HealthTransition::None);

    incrTime(std::chrono::seconds(1));
    EXPECT_EQ(fail().transition, HealthTransition::EnteredFailSafe);
    EXPECT_EQ(zone_.status, ZoneStatus::FailSafe);

    incrTime(std::chrono::seconds(60));
    EXPECT_EQ(fail().transition, HealthTransition::None);
    EXPECT_EQ(zone_.status, ZoneStatus::FailSafe);
}

TEST_F(ZoneHealthTest, RecoversFromDegradedAndFailSafe) {
    succeed();
    fail();
    ASSERT_EQ(zone_.status, ZoneStatus::Degraded);

    EXPECT_EQ(succeed().transition, HealthTransition::Recovered);
    EXPECT_EQ(zone_.status, ZoneStatus::Normal);
    EXPECT_EQ(zone_.consecutiveFailures, 0);

    incrTime(params_.failSafeTimeout + std::chrono::seconds(1));
    fail();
    ASSERT_EQ(zone_.status, ZoneStatus::FailSafe);

    incrTime(std::chrono::seconds(60));
    EXPECT_EQ(succeed().transition, HealthTransition::Recovered);
    EXPECT_EQ(zone_.status, ZoneStatus::Normal);
    EXPECT_EQ(zone_.lastSuccessfulUpdate, now_);
}

TEST_F(ZoneHealthTest, LongTimeoutAfterRecoveryFromInitialFailSafe) {
    fail();
    incrTime(params_.initializingTimeout + std::chrono::seconds(1));
    fail();
    ASSERT_EQ(zone_.status, ZoneStatus::FailSafe);

    succeed();
    incrTime(params_.initializingTimeout + std::chrono::seconds(1));
    HealthUpdate update = fail();

    EXPECT_EQ(update.transition, HealthTransition::EnteredDegraded);
    EXPECT_EQ(update.timeoutUsed, params_.failSafeTimeout);
}

TEST(ControllerStatusTest, Aggregation) {
    EXPECT_EQ(aggregateControllerStatus({ZoneStatus::Initializing, ZoneStatus::Initializing}),
              ControllerStatus::Initializing);
    EXPECT_EQ(aggregateControllerStatus({ZoneStatus::Normal, ZoneStatus::Normal}),
              ControllerStatus::Normal);
    EXPECT_EQ(aggregateControllerStatus({ZoneStatus::Normal, ZoneStatus::Initializing}),
              ControllerStatus::Normal);
    EXPECT_EQ(aggregateControllerStatus({ZoneStatus::Initializing, ZoneStatus::Degraded}),
              ControllerStatus::Degraded);
    EXPECT_EQ(aggregateControllerStatus({ZoneStatus::Degraded, ZoneStatus::FailSafe}),
              ControllerStatus::Degraded);
    EXPECT_EQ(aggregateControllerStatus({ZoneStatus::Degraded}), ControllerStatus::Degraded);
    EXPECT_EQ(aggregateControllerStatus({}), ControllerStatus::Normal);
}

TEST(ControllerStatusTest, AllFailSafe) {
    EXPECT_EQ(aggregateControllerStatus({ZoneStatus::FailSafe}), ControllerStatus::FailSafe);
    EXPECT_EQ(aggregateControllerStatus(
                  {ZoneStatus::FailSafe, ZoneStatus::FailSafe, ZoneStatus::FailSafe}),
              ControllerStatus::FailSafe);
}

TEST(ControllerStatusTest, OneNormalZoneNeverFailSafe) {
    EXPECT_EQ(aggregateControllerStatus(
                  {ZoneStatus::Normal, ZoneStatus::Degraded, ZoneStatus::Degraded}),
              ControllerStatus::Degraded);
    EXPECT_EQ(aggregateControllerStatus(
                  {ZoneStatus::Normal, ZoneStatus::FailSafe, ZoneStatus::FailSafe}),
              ControllerStatus::Degraded);
}
