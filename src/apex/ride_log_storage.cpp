#include "apex/ride_log_storage.h"

#include <stdio.h>

#include <fstream>
#include <utility>

#include "apex/debug_log.h"

JsonlRideStorage::JsonlRideStorage(std::string path, std::string userId, bool geometrySupported)
  : filePath(std::move(path)), user(std::move(userId)), geometrySupported(geometrySupported) {}

StorageStatus JsonlRideStorage::resolveUser(std::string* userId) {
  if (user.empty()) return StorageStatus::NOT_AUTHENTICATED;
  if (userId != nullptr) *userId = user;
  return StorageStatus::OK;
}

StorageStatus JsonlRideStorage::insertRideWithGeometry(const FinishedRide& ride,
                                                       FinishedRide* created) {
  if (!geometrySupported) return StorageStatus::CAPABILITY_MISSING;
  if (!ride.routeGeometry) return StorageStatus::CONSTRAINT;
  return append(ride, true, created);
}

StorageStatus JsonlRideStorage::insertRide(const FinishedRide& ride, FinishedRide* created) {
  return append(ride, false, created);
}

StorageStatus JsonlRideStorage::append(const FinishedRide& ride, bool withGeometry,
                                       FinishedRide* created) {
  if (ride.userId.empty() || ride.userId != user) return StorageStatus::NOT_AUTHENTICATED;
  if (ride.bikeId.empty() || ride.endTime < ride.startTime) return StorageStatus::CONSTRAINT;

  FinishedRide stored = ride;
  stored.id = nextId(ride);
  if (!withGeometry) stored.routeGeometry.reset();

  JsonDocument doc;
  doc["id"] = stored.id;
  doc["bike_id"] = stored.bikeId;
  doc["user_id"] = stored.userId;
  doc["start_time"] = formatIsoTimestamp(stored.startTime);
  doc["end_time"] = formatIsoTimestamp(stored.endTime);
  doc["start_ms"] = stored.startTime;
  doc["end_ms"] = stored.endTime;
  doc["distance_km"] = stored.distanceKm;
  doc["max_lean_left"] = stored.maxLeanLeft;
  doc["max_lean_right"] = stored.maxLeanRight;
  if (stored.routeGeometry) {
    lineStringToGeoJson(*stored.routeGeometry, doc["route_path"].to<JsonObject>());
  } else {
    doc["route_path"] = nullptr;
  }

  std::ofstream file(filePath, std::ios::app);
  if (!file.is_open()) {
    apexLog(LogLevel::ERROR, "RideLog", "Failed to open %s", filePath.c_str());
    return StorageStatus::IO;
  }
  serializeJson(doc, file);
  file << '\n';
  if (!file.good()) {
    apexLog(LogLevel::ERROR, "RideLog", "Write to %s failed", filePath.c_str());
    return StorageStatus::IO;
  }

  apexLog(LogLevel::INFO, "RideLog", "Stored ride %s (%.2f km)", stored.id.c_str(),
          stored.distanceKm);
  if (created != nullptr) *created = std::move(stored);
  return StorageStatus::OK;
}

std::string JsonlRideStorage::nextId(const FinishedRide& ride) {
  char id[48];
  snprintf(id, sizeof(id), "ride-%lld-%u", static_cast<long long>(ride.startTime),
           static_cast<unsigned>(++insertCount));
  return std::string(id);
}

bool JsonlRideStorage::loadRides(std::vector<FinishedRide>* out) const {
  if (out == nullptr) return false;
  out->clear();

  std::ifstream file(filePath);
  if (!file.is_open()) return false;

  std::string line;
  size_t lineNo = 0;
  while (std::getline(file, line)) {
    ++lineNo;
    if (line.empty()) continue;

    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, line);
    if (error) {
      apexLog(LogLevel::WARN, "RideLog", "Skipping line %zu: %s", lineNo, error.c_str());
      continue;
    }

    FinishedRide ride;
    ride.id = doc["id"].as<std::string>();
    ride.bikeId = doc["bike_id"].as<std::string>();
    ride.userId = doc["user_id"].as<std::string>();
    ride.startTime = doc["start_ms"].as<int64_t>();
    ride.endTime = doc["end_ms"].as<int64_t>();
    ride.distanceKm = doc["distance_km"].as<double>();
    ride.maxLeanLeft = doc["max_lean_left"].as<double>();
    ride.maxLeanRight = doc["max_lean_right"].as<double>();

    LineString route;
    if (!doc["route_path"].isNull() && lineStringFromGeoJson(doc["route_path"], &route)) {
      ride.routeGeometry = std::move(route);
    }
    out->push_back(std::move(ride));
  }
  return true;
}
