// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_SETTINGS_H_
#define INC_APEX_SETTINGS_H_

#include <string>

#include "apex/ride_config.h"

// Recorder configuration persisted in the settings JSON file
struct RecorderSettings {
  double calibrationOffset = 0.0;             // degrees treated as upright
  std::string bikeId;                         // default bike for saved rides
  std::string userId;                         // authenticated rider, empty when signed out
  std::string rideLogPath = DEFAULT_RIDE_LOG_PATH;
  bool geometrySupported = true;              // storage accepts route geometry
  std::string orientationSource = "auto";     // auto | accelerometer | devicemotion
  std::string logLevel = "info";
};

// Where the calibrate action reads and writes the offset
class ICalibrationStore {
 public:
  virtual ~ICalibrationStore() = default;
  virtual double loadCalibrationOffset() const = 0;
  virtual bool saveCalibrationOffset(double offsetDeg) = 0;
};

class SettingsStore : public ICalibrationStore {
 public:
  explicit SettingsStore(std::string path = DEFAULT_SETTINGS_PATH);

  /**
   * Load the settings file.
   * A missing or unparsable file resets to defaults and writes them back.
   * Out of range values are sanitized and the file rewritten.
   *
   * @return true when the file existed and parsed
   */
  bool refresh();

  /** Write the current settings to the file. */
  bool write() const;

  /** Restore defaults and write them. */
  void reset();

  /**
   * Bring every field into its valid range.
   * @return true if any value was changed
   */
  bool sanitize();

  const RecorderSettings& data() const { return settings; }
  RecorderSettings& data() { return settings; }
  const std::string& path() const { return filePath; }

  double loadCalibrationOffset() const override { return settings.calibrationOffset; }
  bool saveCalibrationOffset(double offsetDeg) override;

 private:
  std::string filePath;
  RecorderSettings settings;
};

#endif  // INC_APEX_SETTINGS_H_
