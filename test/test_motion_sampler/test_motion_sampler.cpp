#include <gtest/gtest.h>

#include <limits>

#include "apex/debug_log.h"
#include "apex/motion_sampler.h"
#include "apex/ride_config.h"
#include "../support/fakes.h"

class MotionSamplerTest : public ::testing::Test {
 protected:
  void SetUp() override { setLogLevel(LogLevel::NONE); }

  void fix(double lat, double lon, std::optional<double> speed) {
    source.pushFix(PositionFix{lat, lon, speed});
  }

  SessionStore store;
  FeedPositionSource source;
  ManualClock clock{1000};
  FakeNotifier notices;
  MotionSampler sampler{store, source, clock, &notices};
};

TEST_F(MotionSamplerTest, StartAttachesWatchWithRideOptions) {
  ASSERT_TRUE(sampler.start());
  EXPECT_TRUE(sampler.watching());
  EXPECT_EQ(source.watcherCount(), 1u);

  const auto options = source.lastOptions();
  ASSERT_TRUE(options.has_value());
  EXPECT_TRUE(options->highAccuracy);
  EXPECT_EQ(options->timeoutMs, GPS_TIMEOUT_MS);
  EXPECT_EQ(options->maximumAgeMs, GPS_MAX_FIX_AGE_MS);

  sampler.stop();
  EXPECT_EQ(source.watcherCount(), 0u);
}

TEST_F(MotionSamplerTest, StartFailsWithoutPermission) {
  source.setPermission(PermissionState::DENIED);
  EXPECT_FALSE(sampler.start());
  EXPECT_FALSE(sampler.watching());
}

TEST_F(MotionSamplerTest, IgnoresFixesWhenIdle) {
  sampler.start();
  fix(48.0, 11.0, 5.0);
  EXPECT_TRUE(store.snapshot().coords.empty());
}

TEST_F(MotionSamplerTest, AppendsCoordinateStampedWithClock) {
  store.beginRide(clock.nowMs());
  sampler.start();

  clock.set(5000);
  fix(48.0, 11.0, 6.5);
  clock.set(6000);
  fix(48.001, 11.0, 0.0);
  clock.set(7000);
  fix(48.002, 11.0, std::nullopt);

  const RideSnapshot s = store.snapshot();
  ASSERT_EQ(s.coords.size(), 3u);
  EXPECT_EQ(s.coords[0].timestamp, 5000);
  EXPECT_DOUBLE_EQ(s.coords[0].latitude, 48.0);
  EXPECT_DOUBLE_EQ(s.coords[0].longitude, 11.0);
  ASSERT_TRUE(s.coords[0].speed.has_value());
  EXPECT_DOUBLE_EQ(*s.coords[0].speed, 6.5);
  // Speed is only kept when strictly positive
  EXPECT_FALSE(s.coords[1].speed.has_value());
  EXPECT_FALSE(s.coords[2].speed.has_value());
  EXPECT_GT(s.distanceKm, 0.0);
}

TEST_F(MotionSamplerTest, PublishesCurrentSpeed) {
  store.beginRide(clock.nowMs());
  sampler.start();

  fix(48.0, 11.0, 12.0);
  EXPECT_DOUBLE_EQ(sampler.currentSpeed(), 12.0);
  fix(48.0, 11.0, std::nullopt);
  EXPECT_DOUBLE_EQ(sampler.currentSpeed(), 0.0);
  fix(48.0, 11.0, -1.0);
  EXPECT_DOUBLE_EQ(sampler.currentSpeed(), 0.0);
}

TEST_F(MotionSamplerTest, DropsNonFiniteFixes) {
  store.beginRide(clock.nowMs());
  sampler.start();

  fix(std::numeric_limits<double>::quiet_NaN(), 11.0, 5.0);
  fix(48.0, std::numeric_limits<double>::infinity(), 5.0);
  EXPECT_TRUE(store.snapshot().coords.empty());
  EXPECT_DOUBLE_EQ(sampler.currentSpeed(), 0.0);
}

TEST_F(MotionSamplerTest, IgnoresFixesWhilePaused) {
  store.beginRide(clock.nowMs());
  sampler.start();
  fix(48.0, 11.0, 5.0);
  store.setPaused(true);
  fix(48.01, 11.0, 5.0);
  EXPECT_EQ(store.snapshot().coords.size(), 1u);
}

TEST_F(MotionSamplerTest, PositionErrorsLeaveStateAlone) {
  store.beginRide(clock.nowMs());
  sampler.start();
  fix(48.0, 11.0, 5.0);
  source.pushError("position unavailable");
  EXPECT_EQ(store.snapshot().coords.size(), 1u);
  EXPECT_TRUE(store.isRecording());
  EXPECT_TRUE(sampler.watching());
}

TEST_F(MotionSamplerTest, AutoPausesOnceAfterFiveStillMinutes) {
  store.beginRide(clock.nowMs());
  sampler.start();
  sampler.resetAutoPause();

  clock.advance(1000);
  fix(48.0, 11.0, 0.0);
  EXPECT_EQ(sampler.autoPauseState(), AutoPauseState::STOPPED_PENDING);

  clock.set(1000 + AUTO_PAUSE_STILL_MS - 1);
  EXPECT_FALSE(sampler.tick());
  EXPECT_FALSE(store.isPaused());

  clock.set(1000 + AUTO_PAUSE_STILL_MS);
  EXPECT_TRUE(sampler.tick());
  EXPECT_TRUE(store.isPaused());
  EXPECT_EQ(notices.count(NoticeID::AUTO_PAUSED), 1u);

  clock.advance(60000);
  EXPECT_FALSE(sampler.tick());
  EXPECT_EQ(notices.count(NoticeID::AUTO_PAUSED), 1u);
}

TEST_F(MotionSamplerTest, MovementBeforeDeadlinePreventsAutoPause) {
  store.beginRide(clock.nowMs());
  sampler.start();
  sampler.resetAutoPause();

  clock.advance(1000);
  fix(48.0, 11.0, 0.0);
  clock.advance(4 * 60 * 1000);
  fix(48.001, 11.0, 3.0);
  clock.advance(2 * 60 * 1000);
  EXPECT_FALSE(sampler.tick());
  EXPECT_FALSE(store.isPaused());
  EXPECT_EQ(notices.count(NoticeID::AUTO_PAUSED), 0u);
}

TEST_F(MotionSamplerTest, DestructorReleasesWatch) {
  {
    MotionSampler scoped(store, source, clock, nullptr);
    ASSERT_TRUE(scoped.start());
    EXPECT_EQ(source.watcherCount(), 1u);
  }
  EXPECT_EQ(source.watcherCount(), 0u);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
