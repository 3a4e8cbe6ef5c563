#include "apex/command_protocol.h"

#include <cmath>
#include <vector>

#include "apex/debug_log.h"
#include "apex/distance.h"
#include "apex/ride_config.h"
#include "version.h"

CommandProcessor::CommandProcessor(const CommandTargets& targets) : targets(targets) {}

bool CommandProcessor::handleLine(const std::string& line, std::string* response) {
  JsonDocument in;
  JsonDocument out;
  bool ok = false;

  DeserializationError error = deserializeJson(in, line);
  if (error) {
    apexLog(LogLevel::DEBUG, "Command", "Ignoring non-JSON input (%s)", error.c_str());
    out["ok"] = false;
    out["error"] = "invalid_json";
  } else if (!in["command"].is<const char*>()) {
    out["ok"] = false;
    out["error"] = "missing_command";
  } else {
    const std::string command = in["command"].as<std::string>();

    // Replay input carries its own timeline
    if (targets.replayClock != nullptr && in["t"].is<int64_t>()) {
      targets.replayClock->set(in["t"].as<int64_t>());
    }

    out["command"] = command;
    ok = dispatch(command, in.as<JsonVariantConst>(), out);
    out["ok"] = ok;
  }

  drainNotices(out);
  if (response != nullptr) {
    response->clear();
    serializeJson(out, *response);
  }
  return ok;
}

bool CommandProcessor::dispatch(const std::string& command, JsonVariantConst args,
                                JsonDocument& out) {
  RideRecorder& recorder = targets.recorder;

  if (command == "start") {
    const StartResult result = recorder.start();
    out["result"] = startResultToString(result);
    out["state"] = recorderStateToString(recorder.state());
    return result == StartResult::STARTED;
  }

  if (command == "pause") {
    const bool toggled = recorder.togglePause();
    out["state"] = recorderStateToString(recorder.state());
    return toggled;
  }

  if (command == "stop") {
    const bool save = args["save"] | true;
    std::string bikeId = targets.defaultBikeId;
    if (args["bike_id"].is<const char*>()) bikeId = args["bike_id"].as<std::string>();

    const StopResult result = recorder.stop(save, bikeId);
    out["result"] = stopStatusToString(result.status);
    if (result.status == StopStatus::SAVED || result.status == StopStatus::SAVE_FAILED) {
      out["storage"] = storageStatusToString(result.storage);
      out["fallback"] = result.usedFallback;
    }
    if (result.status == StopStatus::SAVED) {
      JsonObject ride = out["ride"].to<JsonObject>();
      ride["id"] = result.ride.id;
      ride["bike_id"] = result.ride.bikeId;
      ride["distance_km"] = result.ride.distanceKm;
      ride["max_lean_left"] = result.ride.maxLeanLeft;
      ride["max_lean_right"] = result.ride.maxLeanRight;
      ride["has_route"] = result.ride.routeGeometry.has_value();
    }
    out["state"] = recorderStateToString(recorder.state());
    return result.status != StopStatus::SAVE_FAILED;
  }

  if (command == "calibrate") {
    const bool calibrated = recorder.calibrate();
    out["calibration_offset"] = recorder.calibrationOffset();
    return calibrated;
  }

  if (command == "pocket") {
    if (!args["on"].is<bool>()) {
      out["error"] = "missing_on";
      return false;
    }
    recorder.setPocketMode(args["on"].as<bool>());
    out["pocket"] = recorder.snapshot().isPocketMode;
    return true;
  }

  if (command == "fix") {
    if (!args["lat"].is<double>() || !args["lon"].is<double>()) {
      out["error"] = "missing_position";
      return false;
    }
    PositionFix fix = {};
    fix.latitude = args["lat"].as<double>();
    fix.longitude = args["lon"].as<double>();
    if (args["speed"].is<double>()) fix.speed = args["speed"].as<double>();
    targets.position.pushFix(fix);
    out["points"] = recorder.snapshot().coords.size();
    return true;
  }

  if (command == "accel") {
    JsonArrayConst values = args["values"].as<JsonArrayConst>();
    if (values.isNull()) {
      out["error"] = "missing_values";
      return false;
    }
    std::vector<double> vec;
    for (JsonVariantConst v : values) {
      // Non-numeric axes become NaN and are rejected by the lean pipeline
      vec.push_back(v.is<double>() ? v.as<double>() : NAN);
    }
    targets.accelerometer.pushValues(vec);
    out["current_lean"] = recorder.snapshot().currentLean;
    return true;
  }

  if (command == "motion") {
    AccelerationSample sample;
    if (args["x"].is<double>()) sample.x = args["x"].as<double>();
    if (args["y"].is<double>()) sample.y = args["y"].as<double>();
    if (args["z"].is<double>()) sample.z = args["z"].as<double>();
    targets.deviceMotion.pushMotion(sample);
    out["current_lean"] = recorder.snapshot().currentLean;
    return true;
  }

  if (command == "proximity") {
    if (!args["value"].is<double>()) {
      out["error"] = "missing_value";
      return false;
    }
    targets.proximity.pushValue(args["value"].as<double>());
    out["pocket"] = recorder.snapshot().isPocketMode;
    return true;
  }

  if (command == "gps_error") {
    targets.position.pushError(args["message"] | "unknown error");
    return true;
  }

  if (command == "tick") {
    out["auto_paused"] = recorder.tick();
    out["state"] = recorderStateToString(recorder.state());
    return true;
  }

  if (command == "permission") {
    PermissionState state = PermissionState::GRANTED;
    if (args["location"].is<const char*>()) {
      if (!permissionStateFromString(args["location"].as<std::string>(), &state)) {
        out["error"] = "bad_permission";
        return false;
      }
      targets.position.setPermission(state);
      targets.position.setRequestResult(state);
    }
    if (args["motion"].is<const char*>()) {
      if (!permissionStateFromString(args["motion"].as<std::string>(), &state)) {
        out["error"] = "bad_permission";
        return false;
      }
      targets.deviceMotion.setPermission(state);
    }
    if (args["accelerometer"].is<bool>()) {
      targets.accelerometer.setAvailable(args["accelerometer"].as<bool>());
    }
    if (args["proximity"].is<bool>()) {
      targets.proximity.setAvailable(args["proximity"].as<bool>());
    }
    out["location"] = permissionStateToString(targets.position.checkPermission());
    return true;
  }

  if (command == "sync") {
    writeState(out);
    return true;
  }

  apexLog(LogLevel::DEBUG, "Command", "Unknown command '%s'", command.c_str());
  out["error"] = "unknown_command";
  return false;
}

void CommandProcessor::writeState(JsonDocument& doc) const {
  const RideRecorder& recorder = targets.recorder;
  const RideSnapshot session = recorder.snapshot();

  doc["mj_v"] = APEX_VERSION_MAJOR;
  doc["mi_v"] = APEX_VERSION_MINOR;
  doc["state"] = recorderStateToString(recorder.state());
  doc["recording"] = session.isRecording;
  doc["paused"] = session.isPaused;
  doc["pocket"] = session.isPocketMode;
  doc["points"] = session.coords.size();
  doc["distance_km"] = roundTo(session.distanceKm, RIDE_DISTANCE_DECIMALS);
  doc["current_lean"] = roundTo(session.currentLean, RIDE_LEAN_DECIMALS);
  doc["max_lean_left"] = roundTo(session.maxLeanLeft, RIDE_LEAN_DECIMALS);
  doc["max_lean_right"] = roundTo(session.maxLeanRight, RIDE_LEAN_DECIMALS);
  if (session.startTime) {
    doc["start_time"] = *session.startTime;
  } else {
    doc["start_time"] = nullptr;
  }
  doc["speed_kmh"] = roundTo(recorder.currentSpeed() * 3.6, 1);
  doc["auto_pause"] = autoPauseStateToString(recorder.autoPauseState());
  doc["calibration_offset"] = recorder.calibrationOffset();
  doc["gps"] = recorder.hasPositionWatch();
  doc["orientation"] = recorder.orientationSource();
  doc["proximity"] = recorder.hasProximityWatch();
  doc["coords_seq"] = session.coordsSeq;
  doc["lean_seq"] = session.leanSeq;
}

void CommandProcessor::drainNotices(JsonDocument& out) {
  if (targets.notices == nullptr || targets.notices->size() == 0) return;

  JsonArray list = out["notices"].to<JsonArray>();
  Notification notice = {};
  while (targets.notices->pop(&notice)) {
    JsonObject entry = list.add<JsonObject>();
    entry["id"] = noticeIDToString(notice.id);
    entry["severity"] = notice.severity == NotifySeverity::CAUTION ? "caution" : "info";
    entry["message"] = notice.message;
  }
}

bool permissionStateFromString(const std::string& name, PermissionState* out) {
  if (out == nullptr) return false;
  if (name == "granted") {
    *out = PermissionState::GRANTED;
  } else if (name == "denied") {
    *out = PermissionState::DENIED;
  } else if (name == "unavailable") {
    *out = PermissionState::UNAVAILABLE;
  } else {
    return false;
  }
  return true;
}
