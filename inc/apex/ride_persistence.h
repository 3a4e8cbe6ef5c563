// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_RIDE_PERSISTENCE_H_
#define INC_APEX_RIDE_PERSISTENCE_H_

#include <ArduinoJson.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "apex/structs.h"

// Result of a storage call. CAPABILITY_MISSING means the geometry insert is
// not deployed on the backend and is the only status that triggers the plain
// insert fallback.
enum class StorageStatus : uint8_t {
  OK,
  CAPABILITY_MISSING,
  NOT_AUTHENTICATED,
  NETWORK,
  CONSTRAINT,
  IO
};

// Storage collaborator for finished rides
class IRideStorage {
 public:
  virtual ~IRideStorage() = default;

  // Authenticated rider for the insert
  virtual StorageStatus resolveUser(std::string* userId) = 0;

  // Insert carrying ride.routeGeometry. May answer CAPABILITY_MISSING.
  virtual StorageStatus insertRideWithGeometry(const FinishedRide& ride, FinishedRide* created) = 0;

  // Insert ignoring ride.routeGeometry
  virtual StorageStatus insertRide(const FinishedRide& ride, FinishedRide* created) = 0;
};

// Everything the adapter needs from the session at stop time
struct SaveRequest {
  std::string bikeId;
  std::vector<Coordinate> coords;
  int64_t startTime = 0;  // epoch ms
  int64_t endTime = 0;    // epoch ms
  double maxLeanLeft = 0.0;
  double maxLeanRight = 0.0;
};

struct SaveResult {
  StorageStatus status = StorageStatus::IO;
  bool usedFallback = false;  // geometry insert missing, saved without route
  FinishedRide ride;          // as returned by storage when status is OK
};

/**
 * Route polyline in [longitude, latitude] order.
 * @return empty for fewer than 2 coordinates
 */
std::optional<LineString> buildLineString(const std::vector<Coordinate>& coords);

/** Write {"type":"LineString","coordinates":[[lon,lat],...]} into obj. */
void lineStringToGeoJson(const LineString& line, JsonObject obj);

/** Parse a GeoJSON LineString object. */
bool lineStringFromGeoJson(JsonVariantConst obj, LineString* out);

/** "SRID=4326;LINESTRING(lon lat, ...)", empty string for no coordinates. */
std::string routeToWkt(const std::vector<Coordinate>& coords);

/** ISO 8601 UTC with milliseconds, e.g. 2025-03-01T09:30:00.000Z */
std::string formatIsoTimestamp(int64_t epochMs);

/**
 * Persist a finished ride.
 *
 * Resolves the user, rounds distance and peaks, then tries the geometry
 * insert for routes with 2+ points. CAPABILITY_MISSING falls back to the
 * plain insert with the same scalar fields and no geometry. Every other
 * failure is returned unchanged.
 */
SaveResult saveFinishedRide(IRideStorage& storage, const SaveRequest& request);

const char* storageStatusToString(StorageStatus status);

// Short message for the save-failure notice
const char* storageStatusMessage(StorageStatus status);

#endif  // INC_APEX_RIDE_PERSISTENCE_H_
