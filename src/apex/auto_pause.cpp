#include "apex/auto_pause.h"

#include "apex/debug_log.h"

AutoPauseDetector::AutoPauseDetector(int64_t stillMs) : stillMs(stillMs) {}

bool AutoPauseDetector::onSpeed(int64_t nowMs, std::optional<double> speedMs) {
  if (speedMs.has_value() && *speedMs > 0.0) {
    lastMoving = nowMs;
    pending.cancel();
    current = AutoPauseState::MOVING;
    return false;
  }

  if (current == AutoPauseState::MOVING) {
    current = AutoPauseState::STOPPED_PENDING;
    pending.arm(lastMoving + stillMs);
  }
  return fire(nowMs);
}

bool AutoPauseDetector::poll(int64_t nowMs) {
  return fire(nowMs);
}

void AutoPauseDetector::resetBaseline(int64_t nowMs) {
  lastMoving = nowMs;
  pending.cancel();
  current = AutoPauseState::MOVING;
}

bool AutoPauseDetector::fire(int64_t nowMs) {
  if (current != AutoPauseState::STOPPED_PENDING || !pending.expired(nowMs)) {
    return false;
  }
  pending.cancel();
  current = AutoPauseState::AUTO_PAUSED;
  apexLog(LogLevel::DEBUG, "AutoPause", "Still since %lld, pausing at %lld",
          static_cast<long long>(lastMoving), static_cast<long long>(nowMs));
  return true;
}

const char* autoPauseStateToString(AutoPauseState state) {
  switch (state) {
    case AutoPauseState::MOVING: return "MOVING";
    case AutoPauseState::STOPPED_PENDING: return "STOPPED_PENDING";
    case AutoPauseState::AUTO_PAUSED: return "AUTO_PAUSED";
  }
  return "UNKNOWN";
}
