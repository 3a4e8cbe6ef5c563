// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_ORIENTATION_SAMPLER_H_
#define INC_APEX_ORIENTATION_SAMPLER_H_

#include <mutex>
#include <optional>
#include <string>

#include "apex/lean_processor.h"
#include "apex/motion_sampler.h"
#include "apex/notification.h"
#include "apex/sensors.h"
#include "apex/session_store.h"

// Turns acceleration samples into lean updates on the session store.
// The source is chosen once per start() and never swapped mid-ride.
class OrientationSampler {
 public:
  OrientationSampler(SessionStore& store, const MotionSampler& motion,
                     IOrientationSource* accelerometer, IOrientationSource* deviceMotion,
                     INotifier* notifier);
  ~OrientationSampler() { stop(); }

  OrientationSampler(const OrientationSampler&) = delete;
  OrientationSampler& operator=(const OrientationSampler&) = delete;

  /**
   * Pick a source by preference and attach to it.
   * @return false when no orientation source could be used; the ride goes on
   *         without lean data and MOTION_UNAVAILABLE is raised
   */
  bool start(const std::string& preference);
  void stop();
  bool listening() const { return subscription.active(); }
  const char* activeSource() const;

  void onSample(const AccelerationSample& sample);

  void setCalibrationOffset(double offsetDeg);
  double calibrationOffset() const;

  // Zero smoothing and peaks for a new ride
  void resetLean();
  // Continue peak tracking from an existing session
  void restorePeaks(double left, double right);

  // Last raw roll seen (before calibration), empty until the first sample
  std::optional<double> lastRawRoll() const;
  double prevSmoothed() const;

 private:
  SessionStore& store;
  const MotionSampler& motion;
  IOrientationSource* accelerometer;
  IOrientationSource* deviceMotion;
  INotifier* notifier;

  mutable std::mutex leanMutex;
  LeanProcessor processor;
  std::optional<double> rawRoll;

  IOrientationSource* selected = nullptr;
  SensorSubscription subscription;
};

#endif  // INC_APEX_ORIENTATION_SAMPLER_H_
