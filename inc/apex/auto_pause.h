// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_AUTO_PAUSE_H_
#define INC_APEX_AUTO_PAUSE_H_

#include <cstdint>
#include <optional>

#include "apex/deadline.h"

enum class AutoPauseState : uint8_t {
  MOVING,           // last sample reported a non-zero speed
  STOPPED_PENDING,  // no movement, deadline armed
  AUTO_PAUSED       // deadline passed, pause raised once
};

/**
 * Auto-pause detector
 *
 * Tracks the time of the last non-zero speed. A zero or missing speed arms a
 * deadline AUTO_PAUSE_STILL_MS after that baseline; the transition to
 * AUTO_PAUSED is reported exactly once per still run. Any non-zero speed
 * returns to MOVING and cancels the deadline.
 */
class AutoPauseDetector {
 public:
  explicit AutoPauseDetector(int64_t stillMs);

  /**
   * Feed one position sample.
   * @return true only on the sample that causes the auto-pause
   */
  bool onSpeed(int64_t nowMs, std::optional<double> speedMs);

  /** Evaluate the deadline between samples. Same return as onSpeed(). */
  bool poll(int64_t nowMs);

  /** Restart the still period from nowMs (ride start, manual pause/resume). */
  void resetBaseline(int64_t nowMs);

  AutoPauseState state() const { return current; }
  int64_t lastMovingMs() const { return lastMoving; }
  const Deadline& deadline() const { return pending; }

 private:
  bool fire(int64_t nowMs);

  int64_t stillMs;
  int64_t lastMoving = 0;
  AutoPauseState current = AutoPauseState::MOVING;
  Deadline pending;
};

const char* autoPauseStateToString(AutoPauseState state);

#endif  // INC_APEX_AUTO_PAUSE_H_
