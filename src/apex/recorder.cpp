#include "apex/recorder.h"

#include "apex/debug_log.h"

RideRecorder::RideRecorder(const RecorderContext& ctx)
  : store(ctx.store),
    position(ctx.position),
    storage(ctx.storage),
    calibration(ctx.calibration),
    clock(ctx.clock),
    notifier(ctx.notifier),
    proximity(ctx.proximity),
    orientationPreference(ctx.orientationPreference),
    motion(ctx.store, ctx.position, ctx.clock, ctx.notifier),
    orientation(ctx.store, motion, ctx.accelerometer, ctx.deviceMotion, ctx.notifier) {
  if (calibration != nullptr) {
    orientation.setCalibrationOffset(calibration->loadCalibrationOffset());
  }
  recover();
}

RideRecorder::~RideRecorder() {
  releaseSensors();
}

StartResult RideRecorder::start() {
  if (store.isRecording()) {
    apexLog(LogLevel::DEBUG, "Recorder", "Start ignored, already recording");
    return StartResult::ALREADY_RECORDING;
  }

  if (!ensureLocationPermission()) {
    apexLog(LogLevel::WARN, "Recorder", "Location permission not granted, cannot start ride");
    return StartResult::PERMISSION_DENIED;
  }

  const int64_t now = clock.nowMs();
  store.beginRide(now);
  orientation.resetLean();
  attachSensors();

  apexLog(LogLevel::INFO, "Recorder", "Ride started at %lld", static_cast<long long>(now));
  return StartResult::STARTED;
}

bool RideRecorder::togglePause() {
  if (!store.isRecording()) return false;

  const bool paused = !store.isPaused();
  store.setPaused(paused);
  // Either direction restarts the still period
  motion.resetAutoPause();
  if (paused) {
    releaseProximity();
    store.setPocketMode(false);
  } else {
    attachProximity();
  }

  apexLog(LogLevel::INFO, "Recorder", "Ride %s", paused ? "paused" : "resumed");
  return true;
}

StopResult RideRecorder::stop(bool save, const std::string& bikeId) {
  releaseSensors();
  store.clearRecordingFlags();
  store.setPocketMode(false);

  StopResult result;
  if (!save) {
    store.resetRide();
    orientation.resetLean();
    apexLog(LogLevel::INFO, "Recorder", "Ride discarded");
    result.status = StopStatus::DISCARDED;
    return result;
  }

  const RideSnapshot session = store.snapshot();
  if (session.coords.empty() || !session.startTime) {
    store.resetRide();
    orientation.resetLean();
    apexLog(LogLevel::INFO, "Recorder", "Nothing to save (%zu points)", session.coords.size());
    result.status = StopStatus::NOTHING_TO_SAVE;
    return result;
  }

  SaveRequest request;
  request.bikeId = bikeId;
  request.coords = session.coords;
  request.startTime = *session.startTime;
  request.endTime = clock.nowMs();
  request.maxLeanLeft = session.maxLeanLeft;
  request.maxLeanRight = session.maxLeanRight;

  const SaveResult saved = saveFinishedRide(storage, request);
  result.storage = saved.status;
  result.usedFallback = saved.usedFallback;

  if (saved.status != StorageStatus::OK) {
    // Keep coords and start time so the caller can retry
    result.status = StopStatus::SAVE_FAILED;
    notify(NoticeID::SAVE_FAILED, NotifySeverity::CAUTION, storageStatusMessage(saved.status));
    return result;
  }

  result.status = StopStatus::SAVED;
  result.ride = saved.ride;
  store.resetRide();
  orientation.resetLean();
  notify(NoticeID::RIDE_SAVED, NotifySeverity::INFO,
         saved.usedFallback ? "Ride saved (route not stored)" : "Ride saved");
  return result;
}

bool RideRecorder::calibrate() {
  const std::optional<double> raw = orientation.lastRawRoll();
  if (!raw) {
    apexLog(LogLevel::WARN, "Recorder", "No orientation reading to calibrate against");
    return false;
  }

  orientation.setCalibrationOffset(*raw);
  if (calibration != nullptr && !calibration->saveCalibrationOffset(*raw)) {
    apexLog(LogLevel::WARN, "Recorder", "Calibration applied but not persisted");
  }
  apexLog(LogLevel::INFO, "Recorder", "Calibrated: upright is %.2f deg", *raw);
  return true;
}

void RideRecorder::setPocketMode(bool on) {
  store.setPocketMode(on);
  apexLog(LogLevel::INFO, "Recorder", "Pocket mode %s", on ? "on" : "off");
}

bool RideRecorder::tick() {
  return motion.tick();
}

RecorderState RideRecorder::state() const {
  const RideSnapshot session = store.snapshot();
  if (!session.isRecording) return RecorderState::IDLE;
  return session.isPaused ? RecorderState::PAUSED : RecorderState::ACTIVE;
}

bool RideRecorder::ensureLocationPermission() {
  PermissionState permission = position.checkPermission();
  if (permission != PermissionState::GRANTED) {
    apexLog(LogLevel::DEBUG, "Recorder", "Requesting location permission (%s)",
            permissionStateToString(permission));
    permission = position.requestPermission();
  }

  if (permission == PermissionState::GRANTED) return true;

  notify(NoticeID::PERMISSION_DENIED, NotifySeverity::CAUTION,
         permission == PermissionState::UNAVAILABLE
           ? "Location services are not available on this device."
           : "Location permission is required to track rides. Please grant permission in app settings.");
  return false;
}

void RideRecorder::attachSensors() {
  // Both samplers degrade on their own when a sensor is missing
  motion.start();
  motion.resetAutoPause();
  orientation.start(orientationPreference);
  if (!store.isPaused()) attachProximity();
}

void RideRecorder::releaseSensors() {
  motion.stop();
  orientation.stop();
  releaseProximity();
}

void RideRecorder::attachProximity() {
  if (proximity == nullptr || proximityWatch.active()) return;
  // A missing sensor leaves pocket mode to setPocketMode()
  proximityWatch = listenProximity(proximity, [this](double value) { onProximity(value); });
}

void RideRecorder::releaseProximity() {
  proximityWatch.reset();
}

void RideRecorder::onProximity(double value) {
  const bool near = value > 0.0;
  if (store.isPocketMode() == near) return;
  store.setPocketMode(near);
  apexLog(LogLevel::INFO, "Recorder", "Pocket mode %s (proximity %.1f)", near ? "on" : "off", value);
}

void RideRecorder::recover() {
  const RideSnapshot session = store.snapshot();
  if (!session.isRecording) return;

  apexLog(LogLevel::INFO, "Recorder", "Resuming ride in progress (%zu points)",
          session.coords.size());

  if (!ensureLocationPermission()) {
    store.clearRecordingFlags();
    store.setPocketMode(false);
    apexLog(LogLevel::WARN, "Recorder", "Permission lost, recording stopped; %zu points kept",
            session.coords.size());
    return;
  }

  orientation.restorePeaks(session.maxLeanLeft, session.maxLeanRight);
  attachSensors();
}

void RideRecorder::notify(NoticeID id, NotifySeverity severity, const char* message) {
  if (notifier == nullptr) return;
  notifier->notify(makeNotification(id, severity, "%s", message));
}

const char* recorderStateToString(RecorderState state) {
  switch (state) {
    case RecorderState::IDLE: return "idle";
    case RecorderState::ACTIVE: return "active";
    case RecorderState::PAUSED: return "paused";
  }
  return "unknown";
}

const char* stopStatusToString(StopStatus status) {
  switch (status) {
    case StopStatus::SAVED: return "saved";
    case StopStatus::DISCARDED: return "discarded";
    case StopStatus::NOTHING_TO_SAVE: return "nothing_to_save";
    case StopStatus::SAVE_FAILED: return "save_failed";
  }
  return "unknown";
}

const char* startResultToString(StartResult result) {
  switch (result) {
    case StartResult::STARTED: return "started";
    case StartResult::ALREADY_RECORDING: return "already_recording";
    case StartResult::PERMISSION_DENIED: return "permission_denied";
  }
  return "unknown";
}
