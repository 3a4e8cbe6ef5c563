#include <gtest/gtest.h>

#include <random>
#include <thread>

#include "apex/distance.h"
#include "apex/session_store.h"

static Coordinate at(double lat, double lon, int64_t t) {
  Coordinate c = {};
  c.latitude = lat;
  c.longitude = lon;
  c.timestamp = t;
  return c;
}

TEST(SessionStore, StartsIdleAndEmpty) {
  SessionStore store;
  const RideSnapshot s = store.snapshot();
  EXPECT_FALSE(s.isRecording);
  EXPECT_FALSE(s.isPaused);
  EXPECT_TRUE(s.coords.empty());
  EXPECT_FALSE(s.startTime.has_value());
}

TEST(SessionStore, AppendRequiresActiveRecording) {
  SessionStore store;
  EXPECT_FALSE(store.appendCoordinate(at(0.0, 0.0, 0)));

  store.beginRide(1000);
  EXPECT_TRUE(store.appendCoordinate(at(0.0, 0.0, 1000)));

  store.setPaused(true);
  EXPECT_FALSE(store.appendCoordinate(at(0.01, 0.0, 2000)));
  EXPECT_EQ(store.snapshot().coords.size(), 1u);

  store.setPaused(false);
  EXPECT_TRUE(store.appendCoordinate(at(0.01, 0.0, 3000)));
  EXPECT_EQ(store.snapshot().coords.size(), 2u);
}

TEST(SessionStore, PauseImpliesRecording) {
  SessionStore store;
  store.setPaused(true);
  EXPECT_FALSE(store.isPaused());
}

TEST(SessionStore, DistanceTracksRouteAtEveryStep) {
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> step(-0.001, 0.001);

  SessionStore store;
  store.beginRide(0);
  double lat = 45.0;
  double lon = 7.0;
  for (int i = 0; i < 300; ++i) {
    lat += step(rng);
    lon += step(rng);
    ASSERT_TRUE(store.appendCoordinate(at(lat, lon, i * 1000)));
    const RideSnapshot s = store.snapshot();
    EXPECT_NEAR(s.distanceKm, routeDistanceKm(s.coords), 1e-9);
  }
}

TEST(SessionStore, ThreeCoordinateScenario) {
  SessionStore store;
  store.beginRide(0);
  store.appendCoordinate(at(0.0, 0.0, 0));
  store.appendCoordinate(at(0.01, 0.0, 1000));
  store.appendCoordinate(at(0.02, 0.0, 2000));
  EXPECT_NEAR(store.snapshot().distanceKm, 2.22, 0.01);
}

TEST(SessionStore, PeaksOnlyMoveUp) {
  SessionStore store;
  store.beginRide(0);
  ASSERT_TRUE(store.applyLean(10.0, 10.0, 0.0));
  ASSERT_TRUE(store.applyLean(4.0, 3.0, 4.0));

  const RideSnapshot s = store.snapshot();
  EXPECT_DOUBLE_EQ(s.currentLean, 4.0);
  EXPECT_DOUBLE_EQ(s.maxLeanLeft, 10.0);
  EXPECT_DOUBLE_EQ(s.maxLeanRight, 4.0);
}

TEST(SessionStore, PocketModeHoldsLean) {
  SessionStore store;
  store.beginRide(0);
  store.applyLean(12.0, 0.0, 12.0);
  const uint32_t seq = store.leanSeq();

  store.setPocketMode(true);
  EXPECT_FALSE(store.applyLean(30.0, 0.0, 30.0));
  EXPECT_DOUBLE_EQ(store.snapshot().currentLean, 12.0);
  EXPECT_DOUBLE_EQ(store.snapshot().maxLeanRight, 12.0);
  EXPECT_EQ(store.leanSeq(), seq);

  store.setPocketMode(false);
  EXPECT_TRUE(store.applyLean(30.0, 0.0, 30.0));
}

TEST(SessionStore, BeginRideResetsEverything) {
  SessionStore store;
  store.beginRide(1000);
  store.appendCoordinate(at(0.0, 0.0, 1000));
  store.appendCoordinate(at(0.01, 0.0, 2000));
  store.applyLean(20.0, 20.0, 15.0);
  store.setPocketMode(true);

  store.beginRide(50000);
  const RideSnapshot s = store.snapshot();
  EXPECT_TRUE(s.isRecording);
  EXPECT_FALSE(s.isPaused);
  EXPECT_FALSE(s.isPocketMode);
  EXPECT_TRUE(s.coords.empty());
  EXPECT_DOUBLE_EQ(s.distanceKm, 0.0);
  EXPECT_DOUBLE_EQ(s.currentLean, 0.0);
  EXPECT_DOUBLE_EQ(s.maxLeanLeft, 0.0);
  EXPECT_DOUBLE_EQ(s.maxLeanRight, 0.0);
  EXPECT_EQ(s.startTime.value_or(-1), 50000);
}

TEST(SessionStore, ClearRecordingFlagsKeepsRide) {
  SessionStore store;
  store.beginRide(1000);
  store.appendCoordinate(at(0.0, 0.0, 1000));
  store.setPaused(true);

  store.clearRecordingFlags();
  const RideSnapshot s = store.snapshot();
  EXPECT_FALSE(s.isRecording);
  EXPECT_FALSE(s.isPaused);
  EXPECT_EQ(s.coords.size(), 1u);
  EXPECT_EQ(s.startTime.value_or(-1), 1000);
}

TEST(SessionStore, SequenceCountersAdvance) {
  SessionStore store;
  const uint32_t c0 = store.coordsSeq();
  const uint32_t l0 = store.leanSeq();

  store.beginRide(0);
  store.appendCoordinate(at(0.0, 0.0, 0));
  store.applyLean(1.0, 0.0, 1.0);
  EXPECT_GT(store.coordsSeq(), c0);
  EXPECT_GT(store.leanSeq(), l0);

  const uint32_t c1 = store.coordsSeq();
  store.resetRide();
  EXPECT_GT(store.coordsSeq(), c1);
  EXPECT_FALSE(store.isRecording());
  EXPECT_TRUE(store.snapshot().coords.empty());
}

TEST(SessionStore, ConcurrentProducersKeepTheirFields) {
  SessionStore store;
  store.beginRide(0);

  const int points = 2000;
  std::thread position([&]() {
    for (int i = 0; i < points; ++i) {
      store.appendCoordinate(at(i * 0.0001, 0.0, i));
    }
  });
  std::thread orientation([&]() {
    for (int i = 0; i < points; ++i) {
      store.applyLean(i % 50, (i % 50) / 2.0, i % 50);
    }
  });
  position.join();
  orientation.join();

  const RideSnapshot s = store.snapshot();
  ASSERT_EQ(s.coords.size(), static_cast<size_t>(points));
  for (int i = 1; i < points; ++i) {
    EXPECT_LT(s.coords[i - 1].timestamp, s.coords[i].timestamp);
  }
  EXPECT_NEAR(s.distanceKm, routeDistanceKm(s.coords), 1e-9);
  EXPECT_DOUBLE_EQ(s.maxLeanRight, 49.0);
  EXPECT_DOUBLE_EQ(s.maxLeanLeft, 24.5);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
