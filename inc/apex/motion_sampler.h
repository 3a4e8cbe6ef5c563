// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_MOTION_SAMPLER_H_
#define INC_APEX_MOTION_SAMPLER_H_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "apex/auto_pause.h"
#include "apex/clock.h"
#include "apex/notification.h"
#include "apex/sensors.h"
#include "apex/session_store.h"

// Turns the platform position stream into ride coordinates.
// Accepted fixes extend the route in the session store, publish the current
// speed for the lean motion lock and feed the auto-pause detector.
class MotionSampler {
 public:
  MotionSampler(SessionStore& store, IPositionSource& source, const IClock& clock,
                INotifier* notifier);
  ~MotionSampler() { stop(); }

  MotionSampler(const MotionSampler&) = delete;
  MotionSampler& operator=(const MotionSampler&) = delete;

  /**
   * Attach the position watch with defaultWatchOptions().
   * @return false when the watch could not be attached (recording continues
   *         without position data)
   */
  bool start();
  void stop();
  bool watching() const { return subscription.active(); }

  // Position callbacks, public so a host can feed them directly
  void onFix(const PositionFix& fix);
  void onError(const std::string& message);

  /** Evaluate the auto-pause deadline between fixes. */
  bool tick();

  /** Restart the still period (ride start, manual pause or resume). */
  void resetAutoPause();

  double currentSpeed() const { return speedMs.load(); }
  AutoPauseState autoPauseState() const;

 private:
  void raiseAutoPause();

  SessionStore& store;
  IPositionSource& source;
  const IClock& clock;
  INotifier* notifier;

  std::atomic<double> speedMs{0.0};
  mutable std::mutex detectorMutex;
  AutoPauseDetector detector;
  SensorSubscription subscription;
};

#endif  // INC_APEX_MOTION_SAMPLER_H_
