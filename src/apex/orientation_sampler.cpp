#include "apex/orientation_sampler.h"

#include "apex/debug_log.h"

OrientationSampler::OrientationSampler(SessionStore& store, const MotionSampler& motion,
                                       IOrientationSource* accelerometer,
                                       IOrientationSource* deviceMotion, INotifier* notifier)
  : store(store),
    motion(motion),
    accelerometer(accelerometer),
    deviceMotion(deviceMotion),
    notifier(notifier) {}

bool OrientationSampler::start(const std::string& preference) {
  stop();

  IOrientationSource* source = selectOrientationSource(preference, accelerometer, deviceMotion);
  PermissionState permission = PermissionState::UNAVAILABLE;
  if (source != nullptr) {
    permission = source->requestPermission();
    if (permission == PermissionState::GRANTED) {
      subscription = listenOrientation(
        source, [this](const AccelerationSample& sample) { onSample(sample); });
    }
  }

  if (!subscription.active()) {
    apexLog(LogLevel::WARN, "Lean", "No orientation source (%s), recording without lean",
            source != nullptr ? permissionStateToString(permission) : "none available");
    if (notifier != nullptr) {
      notifier->notify(makeNotification(NoticeID::MOTION_UNAVAILABLE, NotifySeverity::CAUTION,
                                        "Motion sensor unavailable, lean angle will not be recorded"));
    }
    return false;
  }

  selected = source;
  apexLog(LogLevel::DEBUG, "Lean", "Listening to %s", source->name());
  return true;
}

void OrientationSampler::stop() {
  subscription.reset();
  selected = nullptr;
}

const char* OrientationSampler::activeSource() const {
  return selected != nullptr ? selected->name() : "none";
}

void OrientationSampler::onSample(const AccelerationSample& sample) {
  if (!sample.x || !sample.y || !sample.z) return;

  double roll = 0.0;
  if (!rollFromAcceleration(*sample.x, *sample.y, *sample.z, &roll)) return;

  std::lock_guard<std::mutex> lock(leanMutex);
  rawRoll = roll;

  // Pocket mode holds the displayed lean and peaks
  if (store.isPocketMode() || !store.isRecording() || store.isPaused()) return;

  const LeanSample result = processor.process(roll, motion.currentSpeed());
  store.applyLean(result.lean, processor.maxLeanLeft(), processor.maxLeanRight());
}

void OrientationSampler::setCalibrationOffset(double offsetDeg) {
  std::lock_guard<std::mutex> lock(leanMutex);
  processor.setCalibrationOffset(offsetDeg);
}

double OrientationSampler::calibrationOffset() const {
  std::lock_guard<std::mutex> lock(leanMutex);
  return processor.calibrationOffset();
}

void OrientationSampler::resetLean() {
  std::lock_guard<std::mutex> lock(leanMutex);
  processor.reset();
}

void OrientationSampler::restorePeaks(double left, double right) {
  std::lock_guard<std::mutex> lock(leanMutex);
  processor.restorePeaks(left, right);
}

std::optional<double> OrientationSampler::lastRawRoll() const {
  std::lock_guard<std::mutex> lock(leanMutex);
  return rawRoll;
}

double OrientationSampler::prevSmoothed() const {
  std::lock_guard<std::mutex> lock(leanMutex);
  return processor.prevSmoothed();
}
