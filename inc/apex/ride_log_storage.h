// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_RIDE_LOG_STORAGE_H_
#define INC_APEX_RIDE_LOG_STORAGE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "apex/ride_persistence.h"

// Ride storage backed by a JSON-lines file, one ride object per line.
// Fields follow the rides table: bike_id, user_id, start_time, end_time,
// distance_km, max_lean_left, max_lean_right, route_path (GeoJSON or null).
class JsonlRideStorage : public IRideStorage {
 public:
  JsonlRideStorage(std::string path, std::string userId, bool geometrySupported = true);

  StorageStatus resolveUser(std::string* userId) override;
  StorageStatus insertRideWithGeometry(const FinishedRide& ride, FinishedRide* created) override;
  StorageStatus insertRide(const FinishedRide& ride, FinishedRide* created) override;

  /**
   * Read every ride back from the log.
   * Unparsable lines are skipped and logged.
   */
  bool loadRides(std::vector<FinishedRide>* out) const;

  const std::string& path() const { return filePath; }

 private:
  StorageStatus append(const FinishedRide& ride, bool withGeometry, FinishedRide* created);
  std::string nextId(const FinishedRide& ride);

  std::string filePath;
  std::string user;
  bool geometrySupported;
  uint32_t insertCount = 0;
};

#endif  // INC_APEX_RIDE_LOG_STORAGE_H_
