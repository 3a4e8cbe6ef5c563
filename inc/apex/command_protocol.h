// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_COMMAND_PROTOCOL_H_
#define INC_APEX_COMMAND_PROTOCOL_H_

#include <ArduinoJson.h>

#include <string>

#include "apex/clock.h"
#include "apex/notification.h"
#include "apex/recorder.h"
#include "apex/sensors.h"

/**
 * Line oriented JSON command protocol
 *
 * One object per line, e.g. {"command":"fix","lat":48.1,"lon":11.5,"speed":8.2}.
 * Any command may carry "t" (epoch ms) to drive a replay clock.
 * Every command answers with one JSON object; pending notices are drained
 * into its "notices" array.
 */

// Sensor feeds and state the protocol drives besides the recorder
struct CommandTargets {
  RideRecorder& recorder;
  FeedPositionSource& position;
  AccelerometerSource& accelerometer;
  DeviceMotionSource& deviceMotion;
  FeedProximitySource& proximity;
  ManualClock* replayClock;       // nullptr when running on the wall clock
  NotificationQueue* notices;     // nullptr to skip notice reporting
  std::string defaultBikeId;
};

class CommandProcessor {
 public:
  explicit CommandProcessor(const CommandTargets& targets);

  /**
   * Parse and execute one command line.
   *
   * @param line     raw input line
   * @param response serialized JSON answer (always written)
   * @return false for unparsable input, unknown commands or bad arguments
   */
  bool handleLine(const std::string& line, std::string* response);

  /** Fill doc with the current ride state ("sync" answer). */
  void writeState(JsonDocument& doc) const;

 private:
  bool dispatch(const std::string& command, JsonVariantConst args, JsonDocument& out);
  void drainNotices(JsonDocument& out);

  CommandTargets targets;
};

/** Parse "granted", "denied" or "unavailable". */
bool permissionStateFromString(const std::string& name, PermissionState* out);

#endif  // INC_APEX_COMMAND_PROTOCOL_H_
