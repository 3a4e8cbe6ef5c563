#include "apex/settings.h"

#include <ArduinoJson.h>

#include <cmath>
#include <fstream>
#include <utility>

#include "apex/debug_log.h"

SettingsStore::SettingsStore(std::string path) : filePath(std::move(path)) {}

bool SettingsStore::refresh() {
  std::ifstream file(filePath);
  if (!file.is_open()) {
    apexLog(LogLevel::INFO, "Settings", "No settings at %s, initializing with defaults",
            filePath.c_str());
    reset();
    return false;
  }

  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, file);
  if (error) {
    apexLog(LogLevel::WARN, "Settings", "Failed to parse %s (%s), using defaults",
            filePath.c_str(), error.c_str());
    reset();
    return false;
  }

  // Load all values with per-field fallback to defaults
  bool dataValid = true;
  const RecorderSettings defaults;
  settings = defaults;

  JsonVariantConst offset = doc[KEY_CALIBRATION_OFFSET];
  if (offset.is<double>()) {
    settings.calibrationOffset = offset.as<double>();
  } else if (!offset.isNull()) {
    apexLog(LogLevel::WARN, "Settings", "Invalid calibration offset, using default");
    dataValid = false;
  }

  if (doc[KEY_BIKE_ID].is<const char*>()) settings.bikeId = doc[KEY_BIKE_ID].as<std::string>();
  if (doc[KEY_USER_ID].is<const char*>()) settings.userId = doc[KEY_USER_ID].as<std::string>();
  if (doc[KEY_RIDE_LOG_PATH].is<const char*>()) {
    settings.rideLogPath = doc[KEY_RIDE_LOG_PATH].as<std::string>();
  }
  if (doc[KEY_GEOMETRY_SUPPORTED].is<bool>()) {
    settings.geometrySupported = doc[KEY_GEOMETRY_SUPPORTED].as<bool>();
  }
  if (doc[KEY_ORIENTATION_SOURCE].is<const char*>()) {
    settings.orientationSource = doc[KEY_ORIENTATION_SOURCE].as<std::string>();
  }
  if (doc[KEY_LOG_LEVEL].is<const char*>()) {
    settings.logLevel = doc[KEY_LOG_LEVEL].as<std::string>();
  }

  if (sanitize() || !dataValid) {
    apexLog(LogLevel::INFO, "Settings", "Sanitized settings values");
    write();
  }

  apexLog(LogLevel::DEBUG, "Settings", "Loaded %s", filePath.c_str());
  return true;
}

bool SettingsStore::write() const {
  JsonDocument doc;
  doc[KEY_CALIBRATION_OFFSET] = settings.calibrationOffset;
  doc[KEY_BIKE_ID] = settings.bikeId;
  doc[KEY_USER_ID] = settings.userId;
  doc[KEY_RIDE_LOG_PATH] = settings.rideLogPath;
  doc[KEY_GEOMETRY_SUPPORTED] = settings.geometrySupported;
  doc[KEY_ORIENTATION_SOURCE] = settings.orientationSource;
  doc[KEY_LOG_LEVEL] = settings.logLevel;

  std::ofstream file(filePath, std::ios::trunc);
  if (!file.is_open()) {
    apexLog(LogLevel::ERROR, "Settings", "Failed to open %s for writing", filePath.c_str());
    return false;
  }
  serializeJsonPretty(doc, file);
  file << '\n';
  if (!file.good()) {
    apexLog(LogLevel::WARN, "Settings", "Settings may not have been saved correctly");
    return false;
  }
  return true;
}

void SettingsStore::reset() {
  settings = RecorderSettings();
  if (write()) {
    apexLog(LogLevel::INFO, "Settings", "Settings reset to defaults");
  }
}

bool SettingsStore::sanitize() {
  bool changed = false;

  // A phone held flat reads at most +-90 degrees of roll
  if (!std::isfinite(settings.calibrationOffset) || std::fabs(settings.calibrationOffset) > 90.0) {
    settings.calibrationOffset = 0.0;
    changed = true;
  }

  if (settings.rideLogPath.empty()) {
    settings.rideLogPath = DEFAULT_RIDE_LOG_PATH;
    changed = true;
  }

  if (settings.orientationSource != "auto" && settings.orientationSource != "accelerometer" &&
      settings.orientationSource != "devicemotion") {
    settings.orientationSource = "auto";
    changed = true;
  }

  if (settings.logLevel != "debug" && settings.logLevel != "info" && settings.logLevel != "warn" &&
      settings.logLevel != "error" && settings.logLevel != "none") {
    settings.logLevel = "info";
    changed = true;
  }
  return changed;
}

bool SettingsStore::saveCalibrationOffset(double offsetDeg) {
  settings.calibrationOffset = offsetDeg;
  if (sanitize()) {
    apexLog(LogLevel::WARN, "Settings", "Calibration offset %.2f out of range, reset to 0",
            offsetDeg);
  }
  return write();
}
