#include "apex/ride_persistence.h"

#include <stdio.h>
#include <time.h>

#include <utility>

#include "apex/debug_log.h"
#include "apex/distance.h"
#include "apex/ride_config.h"

std::optional<LineString> buildLineString(const std::vector<Coordinate>& coords) {
  if (coords.size() < 2) return std::nullopt;

  LineString line;
  line.coordinates.reserve(coords.size());
  for (const auto& c : coords) {
    line.coordinates.emplace_back(c.longitude, c.latitude);
  }
  return line;
}

void lineStringToGeoJson(const LineString& line, JsonObject obj) {
  obj["type"] = "LineString";
  JsonArray points = obj["coordinates"].to<JsonArray>();
  for (const auto& point : line.coordinates) {
    JsonArray pair = points.add<JsonArray>();
    pair.add(point.first);
    pair.add(point.second);
  }
}

bool lineStringFromGeoJson(JsonVariantConst obj, LineString* out) {
  if (out == nullptr) return false;
  if (obj["type"].as<std::string>() != "LineString") return false;
  JsonArrayConst points = obj["coordinates"].as<JsonArrayConst>();
  if (points.isNull()) return false;

  LineString line;
  for (JsonVariantConst point : points) {
    JsonArrayConst pair = point.as<JsonArrayConst>();
    if (pair.size() != 2 || !pair[0].is<double>() || !pair[1].is<double>()) return false;
    line.coordinates.emplace_back(pair[0].as<double>(), pair[1].as<double>());
  }
  *out = std::move(line);
  return true;
}

std::string routeToWkt(const std::vector<Coordinate>& coords) {
  if (coords.empty()) return std::string();

  std::string wkt = "SRID=4326;LINESTRING(";
  char point[64];
  for (size_t i = 0; i < coords.size(); ++i) {
    snprintf(point, sizeof(point), "%s%.15g %.15g", i == 0 ? "" : ", ",
             coords[i].longitude, coords[i].latitude);
    wkt += point;
  }
  wkt += ")";
  return wkt;
}

std::string formatIsoTimestamp(int64_t epochMs) {
  const time_t seconds = static_cast<time_t>(epochMs / 1000);
  int millis = static_cast<int>(epochMs % 1000);
  struct tm utc = {};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
           utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
           utc.tm_hour, utc.tm_min, utc.tm_sec, millis < 0 ? 0 : millis);
  return std::string(buffer);
}

SaveResult saveFinishedRide(IRideStorage& storage, const SaveRequest& request) {
  SaveResult result;

  std::string userId;
  result.status = storage.resolveUser(&userId);
  if (result.status != StorageStatus::OK) {
    apexLog(LogLevel::ERROR, "Persist", "Cannot resolve user: %s",
            storageStatusToString(result.status));
    return result;
  }

  FinishedRide ride;
  ride.bikeId = request.bikeId;
  ride.userId = userId;
  ride.startTime = request.startTime;
  ride.endTime = request.endTime;
  ride.distanceKm = roundTo(routeDistanceKm(request.coords), RIDE_DISTANCE_DECIMALS);
  ride.maxLeanLeft = roundTo(request.maxLeanLeft, RIDE_LEAN_DECIMALS);
  ride.maxLeanRight = roundTo(request.maxLeanRight, RIDE_LEAN_DECIMALS);
  ride.routeGeometry = buildLineString(request.coords);

  apexLog(LogLevel::DEBUG, "Persist", "Saving ride: %zu points, %.2f km, geometry %s",
          request.coords.size(), ride.distanceKm, ride.routeGeometry ? "yes" : "no");

  if (ride.routeGeometry) {
    result.status = storage.insertRideWithGeometry(ride, &result.ride);
    if (result.status == StorageStatus::OK) return result;

    if (result.status != StorageStatus::CAPABILITY_MISSING) {
      apexLog(LogLevel::ERROR, "Persist", "Geometry insert failed: %s",
              storageStatusToString(result.status));
      return result;
    }

    apexLog(LogLevel::WARN, "Persist", "Geometry insert not available, saving without route");
    result.usedFallback = true;
    ride.routeGeometry.reset();
  }

  result.status = storage.insertRide(ride, &result.ride);
  if (result.status != StorageStatus::OK) {
    apexLog(LogLevel::ERROR, "Persist", "Insert failed: %s", storageStatusToString(result.status));
  }
  return result;
}

const char* storageStatusToString(StorageStatus status) {
  switch (status) {
    case StorageStatus::OK: return "OK";
    case StorageStatus::CAPABILITY_MISSING: return "CAPABILITY_MISSING";
    case StorageStatus::NOT_AUTHENTICATED: return "NOT_AUTHENTICATED";
    case StorageStatus::NETWORK: return "NETWORK";
    case StorageStatus::CONSTRAINT: return "CONSTRAINT";
    case StorageStatus::IO: return "IO";
  }
  return "UNKNOWN";
}

const char* storageStatusMessage(StorageStatus status) {
  switch (status) {
    case StorageStatus::OK: return "Ride saved";
    case StorageStatus::NOT_AUTHENTICATED: return "Session expired. Please sign in again.";
    case StorageStatus::NETWORK: return "Network error. Please check your connection and try again.";
    case StorageStatus::CONSTRAINT: return "Invalid data. Please check your ride information.";
    case StorageStatus::CAPABILITY_MISSING: return "Ride storage is missing a required function.";
    case StorageStatus::IO: break;
  }
  return "Failed to save ride. Please try again.";
}
