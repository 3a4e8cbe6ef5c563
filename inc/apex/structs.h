// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_STRUCTS_H_
#define INC_APEX_STRUCTS_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// One accepted position sample. Immutable once appended to a ride.
struct Coordinate {
  double longitude;
  double latitude;
  int64_t timestamp;             // epoch ms at acquisition
  std::optional<double> speed;   // m/s, only set when the fix reported > 0
};

// Route polyline, points stored as [longitude, latitude]
struct LineString {
  std::vector<std::pair<double, double>> coordinates;
};

// Point-in-time copy of the ride session held by the SessionStore
struct RideSnapshot {
  bool isRecording = false;
  bool isPaused = false;
  bool isPocketMode = false;

  std::vector<Coordinate> coords;
  double distanceKm = 0.0;

  double currentLean = 0.0;
  double maxLeanLeft = 0.0;
  double maxLeanRight = 0.0;

  std::optional<int64_t> startTime;  // epoch ms

  // Monotonic counters so readers can detect new data without consuming it
  uint32_t coordsSeq = 0;
  uint32_t leanSeq = 0;
};

// Ride record as handed to (and returned by) the storage collaborator
struct FinishedRide {
  std::string id;
  std::string bikeId;
  std::string userId;
  int64_t startTime = 0;  // epoch ms
  int64_t endTime = 0;    // epoch ms
  double distanceKm = 0.0;
  double maxLeanLeft = 0.0;
  double maxLeanRight = 0.0;
  std::optional<LineString> routeGeometry;
};

#endif  // INC_APEX_STRUCTS_H_
