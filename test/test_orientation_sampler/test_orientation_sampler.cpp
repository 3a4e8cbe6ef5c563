#include <gtest/gtest.h>

#include <limits>

#include "apex/debug_log.h"
#include "apex/orientation_sampler.h"
#include "apex/ride_config.h"
#include "../support/fakes.h"

class OrientationSamplerTest : public ::testing::Test {
 protected:
  void SetUp() override { setLogLevel(LogLevel::NONE); }

  // Start a ride and report a speed to the motion sampler
  void rideAt(double speedMs) {
    if (!store.isRecording()) store.beginRide(clock.nowMs());
    if (!motion.watching()) motion.start();
    position.pushFix(PositionFix{48.0, 11.0, speedMs});
  }

  void tilt(double deg, int samples = 1) {
    for (int i = 0; i < samples; ++i) accel.pushValues(accelForRoll(deg));
  }

  SessionStore store;
  FeedPositionSource position;
  AccelerometerSource accel;
  DeviceMotionSource deviceMotion;
  ManualClock clock{1000};
  FakeNotifier notices;
  MotionSampler motion{store, position, clock, nullptr};
  OrientationSampler sampler{store, motion, &accel, &deviceMotion, &notices};
};

TEST_F(OrientationSamplerTest, AutoPicksAccelerometer) {
  ASSERT_TRUE(sampler.start("auto"));
  EXPECT_STREQ(sampler.activeSource(), "accelerometer");
  EXPECT_EQ(accel.listenerCount(), 1u);
  EXPECT_EQ(deviceMotion.listenerCount(), 0u);

  sampler.stop();
  EXPECT_EQ(accel.listenerCount(), 0u);
  EXPECT_STREQ(sampler.activeSource(), "none");
}

TEST_F(OrientationSamplerTest, FallsBackToDeviceMotion) {
  accel.setAvailable(false);
  ASSERT_TRUE(sampler.start("auto"));
  EXPECT_STREQ(sampler.activeSource(), "devicemotion");
}

TEST_F(OrientationSamplerTest, DeniedMotionPermissionDegrades) {
  deviceMotion.setPermission(PermissionState::DENIED);
  EXPECT_FALSE(sampler.start("devicemotion"));
  EXPECT_FALSE(sampler.listening());
  EXPECT_EQ(notices.count(NoticeID::MOTION_UNAVAILABLE), 1u);
}

TEST_F(OrientationSamplerTest, NoSourceRaisesNotice) {
  accel.setAvailable(false);
  deviceMotion.setAvailable(false);
  EXPECT_FALSE(sampler.start("auto"));
  EXPECT_EQ(notices.count(NoticeID::MOTION_UNAVAILABLE), 1u);
}

TEST_F(OrientationSamplerTest, TracksRawRollForCalibration) {
  sampler.start("auto");
  EXPECT_FALSE(sampler.lastRawRoll().has_value());

  tilt(12.0);
  ASSERT_TRUE(sampler.lastRawRoll().has_value());
  EXPECT_NEAR(*sampler.lastRawRoll(), 12.0, 1e-9);
}

TEST_F(OrientationSamplerTest, IncompleteOrNonFiniteSamplesAreDropped) {
  sampler.start("auto");
  accel.pushValues({1.0, 2.0});
  accel.pushValues({std::numeric_limits<double>::quiet_NaN(), 0.0, 9.81});
  EXPECT_FALSE(sampler.lastRawRoll().has_value());

  AccelerationSample partial;
  partial.x = 1.0;
  partial.z = 9.0;
  sampler.onSample(partial);
  EXPECT_FALSE(sampler.lastRawRoll().has_value());
}

TEST_F(OrientationSamplerTest, MotionLockKeepsLeanAtZero) {
  sampler.start("auto");
  rideAt(MOTION_LOCK_SPEED_MS - 0.5);

  for (int i = 0; i < 50; ++i) {
    tilt(i % 2 == 0 ? 30.0 : -30.0);
    EXPECT_DOUBLE_EQ(store.snapshot().currentLean, 0.0);
    EXPECT_DOUBLE_EQ(sampler.prevSmoothed(), 0.0);
  }
}

TEST_F(OrientationSamplerTest, LeanStaysWithinClampWhileMoving) {
  sampler.start("auto");
  rideAt(15.0);

  for (int i = 0; i < 100; ++i) {
    tilt(85.0);
    const double lean = store.snapshot().currentLean;
    EXPECT_GE(lean, 0.0);
    EXPECT_LE(lean, LEAN_MAX_DEG);
  }
  EXPECT_DOUBLE_EQ(store.snapshot().maxLeanRight, LEAN_MAX_DEG);
}

TEST_F(OrientationSamplerTest, CalibratedTiltConvergesToZero) {
  sampler.setCalibrationOffset(5.0);
  sampler.start("auto");
  rideAt(15.0);

  tilt(5.0, 40);
  EXPECT_NEAR(store.snapshot().currentLean, 0.0, 1e-9);
  EXPECT_NEAR(store.snapshot().maxLeanLeft, 0.0, 1e-9);
  EXPECT_NEAR(store.snapshot().maxLeanRight, 0.0, 1e-9);
}

TEST_F(OrientationSamplerTest, LeftLeanGoesToLeftPeak) {
  sampler.start("auto");
  rideAt(15.0);
  tilt(-25.0, 30);
  EXPECT_GT(store.snapshot().maxLeanLeft, 20.0);
  EXPECT_DOUBLE_EQ(store.snapshot().maxLeanRight, 0.0);
}

TEST_F(OrientationSamplerTest, PocketModeHoldsLean) {
  sampler.start("auto");
  rideAt(15.0);
  tilt(20.0, 10);
  const RideSnapshot before = store.snapshot();
  ASSERT_GT(before.currentLean, 0.0);

  store.setPocketMode(true);
  tilt(60.0, 20);
  const RideSnapshot held = store.snapshot();
  EXPECT_DOUBLE_EQ(held.currentLean, before.currentLean);
  EXPECT_DOUBLE_EQ(held.maxLeanRight, before.maxLeanRight);
  EXPECT_NEAR(*sampler.lastRawRoll(), 60.0, 1e-9);
}

TEST_F(OrientationSamplerTest, SamplesIgnoredWhenNotRecording) {
  sampler.start("auto");
  tilt(30.0, 5);
  EXPECT_DOUBLE_EQ(store.snapshot().currentLean, 0.0);
  EXPECT_EQ(store.leanSeq(), 0u);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
