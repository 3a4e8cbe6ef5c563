#include "apex/motion_sampler.h"

#include <cmath>

#include "apex/debug_log.h"
#include "apex/ride_config.h"

MotionSampler::MotionSampler(SessionStore& store, IPositionSource& source, const IClock& clock,
                             INotifier* notifier)
  : store(store),
    source(source),
    clock(clock),
    notifier(notifier),
    detector(AUTO_PAUSE_STILL_MS) {}

bool MotionSampler::start() {
  subscription = watchPosition(
    &source, defaultWatchOptions(),
    [this](const PositionFix& fix) { onFix(fix); },
    [this](const std::string& message) { onError(message); });

  if (!subscription.active()) {
    apexLog(LogLevel::WARN, "Motion", "No position watch, recording without GPS");
    return false;
  }
  apexLog(LogLevel::DEBUG, "Motion", "Position watch attached");
  return true;
}

void MotionSampler::stop() {
  subscription.reset();
  speedMs = 0.0;
}

void MotionSampler::onFix(const PositionFix& fix) {
  if (!std::isfinite(fix.latitude) || !std::isfinite(fix.longitude)) {
    apexLog(LogLevel::DEBUG, "Motion", "Dropping non-finite fix");
    return;
  }
  if (!store.isRecording() || store.isPaused()) return;

  const int64_t now = clock.nowMs();
  const bool moving = fix.speed.has_value() && std::isfinite(*fix.speed) && *fix.speed > 0.0;
  speedMs = moving ? *fix.speed : 0.0;

  Coordinate coord = {};
  coord.longitude = fix.longitude;
  coord.latitude = fix.latitude;
  coord.timestamp = now;
  if (moving) coord.speed = *fix.speed;

  if (!store.appendCoordinate(coord)) return;

  bool paused = false;
  {
    std::lock_guard<std::mutex> lock(detectorMutex);
    paused = detector.onSpeed(now, moving ? std::optional<double>(*fix.speed) : std::nullopt);
  }
  if (paused) raiseAutoPause();
}

void MotionSampler::onError(const std::string& message) {
  apexLog(LogLevel::DEBUG, "Motion", "Position error: %s", message.c_str());
}

bool MotionSampler::tick() {
  if (!store.isRecording() || store.isPaused()) return false;

  bool paused = false;
  {
    std::lock_guard<std::mutex> lock(detectorMutex);
    paused = detector.poll(clock.nowMs());
  }
  if (paused) raiseAutoPause();
  return paused;
}

void MotionSampler::resetAutoPause() {
  std::lock_guard<std::mutex> lock(detectorMutex);
  detector.resetBaseline(clock.nowMs());
}

AutoPauseState MotionSampler::autoPauseState() const {
  std::lock_guard<std::mutex> lock(detectorMutex);
  return detector.state();
}

void MotionSampler::raiseAutoPause() {
  store.setPaused(true);
  speedMs = 0.0;
  apexLog(LogLevel::INFO, "Motion", "Auto-paused after %lu s without movement",
          AUTO_PAUSE_STILL_MS / 1000UL);
  if (notifier != nullptr) {
    notifier->notify(makeNotification(NoticeID::AUTO_PAUSED, NotifySeverity::INFO,
                                      "Ride auto-paused: no movement for %lu minutes",
                                      AUTO_PAUSE_STILL_MS / 60000UL));
  }
}
