#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <ArduinoJson.h>

#include "apex/debug_log.h"
#include "apex/ride_log_storage.h"

class RideLogStorageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    setLogLevel(LogLevel::NONE);
    path = ::testing::TempDir() + "apex_rides_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".jsonl";
    std::remove(path.c_str());
  }

  void TearDown() override { std::remove(path.c_str()); }

  static SaveRequest route() {
    SaveRequest request;
    request.bikeId = "bike-3";
    request.coords = {
      Coordinate{11.0, 48.0, 1000, 4.0},
      Coordinate{11.0, 48.01, 2000, 4.0},
      Coordinate{11.0, 48.02, 3000, 4.0},
    };
    request.startTime = 1700000000000LL;
    request.endTime = 1700000600000LL;
    request.maxLeanLeft = 21.04;
    request.maxLeanRight = 33.36;
    return request;
  }

  std::string path;
};

TEST_F(RideLogStorageTest, SignedOutUserIsRejected) {
  JsonlRideStorage storage(path, "");
  std::string user;
  EXPECT_EQ(storage.resolveUser(&user), StorageStatus::NOT_AUTHENTICATED);

  const SaveResult result = saveFinishedRide(storage, route());
  EXPECT_EQ(result.status, StorageStatus::NOT_AUTHENTICATED);
  std::ifstream file(path);
  EXPECT_FALSE(file.is_open());
}

TEST_F(RideLogStorageTest, StoresRideWithRoute) {
  JsonlRideStorage storage(path, "rider-9");
  const SaveResult result = saveFinishedRide(storage, route());
  ASSERT_EQ(result.status, StorageStatus::OK);
  EXPECT_FALSE(result.usedFallback);
  EXPECT_EQ(result.ride.id, "ride-1700000000000-1");

  std::vector<FinishedRide> rides;
  ASSERT_TRUE(storage.loadRides(&rides));
  ASSERT_EQ(rides.size(), 1u);
  const FinishedRide& ride = rides[0];
  EXPECT_EQ(ride.id, result.ride.id);
  EXPECT_EQ(ride.bikeId, "bike-3");
  EXPECT_EQ(ride.userId, "rider-9");
  EXPECT_EQ(ride.startTime, 1700000000000LL);
  EXPECT_EQ(ride.endTime, 1700000600000LL);
  EXPECT_NEAR(ride.distanceKm, 2.22, 1e-9);
  EXPECT_NEAR(ride.maxLeanLeft, 21.0, 1e-9);
  EXPECT_NEAR(ride.maxLeanRight, 33.4, 1e-9);
  ASSERT_TRUE(ride.routeGeometry.has_value());
  ASSERT_EQ(ride.routeGeometry->coordinates.size(), 3u);
  EXPECT_NEAR(ride.routeGeometry->coordinates[2].first, 11.0, 1e-9);
  EXPECT_NEAR(ride.routeGeometry->coordinates[2].second, 48.02, 1e-9);
}

TEST_F(RideLogStorageTest, WritesIsoTimesAndTableFields) {
  JsonlRideStorage storage(path, "rider-9");
  ASSERT_EQ(saveFinishedRide(storage, route()).status, StorageStatus::OK);

  std::ifstream file(path);
  std::string line;
  ASSERT_TRUE(static_cast<bool>(std::getline(file, line)));
  JsonDocument doc;
  ASSERT_FALSE(deserializeJson(doc, line));
  EXPECT_EQ(doc["start_time"].as<std::string>(), "2023-11-14T22:13:20.000Z");
  EXPECT_EQ(doc["end_time"].as<std::string>(), "2023-11-14T22:23:20.000Z");
  EXPECT_EQ(doc["bike_id"].as<std::string>(), "bike-3");
  EXPECT_EQ(doc["route_path"]["type"].as<std::string>(), "LineString");
}

TEST_F(RideLogStorageTest, GeometryUnsupportedFallsBackToPlainInsert) {
  JsonlRideStorage storage(path, "rider-9", false);
  FinishedRide ride;
  EXPECT_EQ(storage.insertRideWithGeometry(ride, nullptr), StorageStatus::CAPABILITY_MISSING);

  const SaveResult result = saveFinishedRide(storage, route());
  ASSERT_EQ(result.status, StorageStatus::OK);
  EXPECT_TRUE(result.usedFallback);

  std::vector<FinishedRide> rides;
  ASSERT_TRUE(storage.loadRides(&rides));
  ASSERT_EQ(rides.size(), 1u);
  EXPECT_FALSE(rides[0].routeGeometry.has_value());
  EXPECT_NEAR(rides[0].distanceKm, 2.22, 1e-9);
}

TEST_F(RideLogStorageTest, MissingBikeViolatesConstraint) {
  JsonlRideStorage storage(path, "rider-9");
  SaveRequest request = route();
  request.bikeId.clear();
  EXPECT_EQ(saveFinishedRide(storage, request).status, StorageStatus::CONSTRAINT);
}

TEST_F(RideLogStorageTest, EndBeforeStartViolatesConstraint) {
  JsonlRideStorage storage(path, "rider-9");
  SaveRequest request = route();
  request.endTime = request.startTime - 1;
  EXPECT_EQ(saveFinishedRide(storage, request).status, StorageStatus::CONSTRAINT);
}

TEST_F(RideLogStorageTest, UnwritablePathIsIoError) {
  JsonlRideStorage storage("/nonexistent-dir/apex/rides.jsonl", "rider-9");
  EXPECT_EQ(saveFinishedRide(storage, route()).status, StorageStatus::IO);
}

TEST_F(RideLogStorageTest, LoadSkipsCorruptLines) {
  JsonlRideStorage storage(path, "rider-9");
  ASSERT_EQ(saveFinishedRide(storage, route()).status, StorageStatus::OK);
  {
    std::ofstream out(path, std::ios::app);
    out << "{truncated\n\n";
  }
  ASSERT_EQ(saveFinishedRide(storage, route()).status, StorageStatus::OK);

  std::vector<FinishedRide> rides;
  ASSERT_TRUE(storage.loadRides(&rides));
  ASSERT_EQ(rides.size(), 2u);
  EXPECT_EQ(rides[1].id, "ride-1700000000000-2");
}

TEST_F(RideLogStorageTest, LoadWithoutFileFails) {
  JsonlRideStorage storage(path, "rider-9");
  std::vector<FinishedRide> rides;
  EXPECT_FALSE(storage.loadRides(&rides));
  EXPECT_FALSE(storage.loadRides(nullptr));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
