// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_RECORDER_H_
#define INC_APEX_RECORDER_H_

#include <cstdint>
#include <optional>
#include <string>

#include "apex/clock.h"
#include "apex/motion_sampler.h"
#include "apex/notification.h"
#include "apex/orientation_sampler.h"
#include "apex/ride_persistence.h"
#include "apex/sensors.h"
#include "apex/session_store.h"
#include "apex/settings.h"

// Recording lifecycle as seen from the session store
enum class RecorderState : uint8_t {
  IDLE,    // not recording
  ACTIVE,  // recording, not paused
  PAUSED   // recording, paused manually or by auto-pause
};

enum class StartResult : uint8_t {
  STARTED,
  ALREADY_RECORDING,
  PERMISSION_DENIED
};

enum class StopStatus : uint8_t {
  SAVED,
  DISCARDED,
  NOTHING_TO_SAVE,  // save requested without coordinates or start time
  SAVE_FAILED       // session data kept, stop(true) may be retried
};

struct StopResult {
  StopStatus status = StopStatus::DISCARDED;
  StorageStatus storage = StorageStatus::OK;
  bool usedFallback = false;
  FinishedRide ride;
};

// Collaborators owned by the caller; all must outlive the recorder
struct RecorderContext {
  SessionStore& store;
  IPositionSource& position;
  IOrientationSource* accelerometer;
  IOrientationSource* deviceMotion;
  IProximitySource* proximity = nullptr;  // drives pocket mode when present
  IRideStorage& storage;
  ICalibrationStore* calibration;
  const IClock& clock;
  INotifier* notifier;
  std::string orientationPreference = "auto";
};

/**
 * Ride recording state machine
 *
 * IDLE -start()-> ACTIVE <-togglePause()-> PAUSED -stop()-> IDLE
 *
 * The session itself lives in the SessionStore. A recorder built on a store
 * that is already recording picks the ride up again (re-requesting the
 * location grant when needed), so the front end can be torn down and rebuilt
 * mid-ride.
 */
class RideRecorder {
 public:
  explicit RideRecorder(const RecorderContext& ctx);
  ~RideRecorder();

  RideRecorder(const RideRecorder&) = delete;
  RideRecorder& operator=(const RideRecorder&) = delete;

  StartResult start();

  /** ACTIVE <-> PAUSED. Returns false when not recording. */
  bool togglePause();

  /**
   * Release the sensors and end the ride.
   *
   * @param save   persist the ride (blocking) before clearing the session
   * @param bikeId bike the ride is filed under
   */
  StopResult stop(bool save, const std::string& bikeId);

  /**
   * Treat the last raw roll reading as upright and persist it.
   * @return false when no orientation sample has been seen yet
   */
  bool calibrate();

  void setPocketMode(bool on);

  /** Evaluate the auto-pause deadline between position fixes. */
  bool tick();

  RecorderState state() const;
  RideSnapshot snapshot() const { return store.snapshot(); }
  double calibrationOffset() const { return orientation.calibrationOffset(); }
  double currentSpeed() const { return motion.currentSpeed(); }
  AutoPauseState autoPauseState() const { return motion.autoPauseState(); }
  bool hasPositionWatch() const { return motion.watching(); }
  bool hasProximityWatch() const { return proximityWatch.active(); }
  const char* orientationSource() const { return orientation.activeSource(); }
  std::optional<double> lastRawRoll() const { return orientation.lastRawRoll(); }

 private:
  bool ensureLocationPermission();
  void attachSensors();
  void releaseSensors();
  void attachProximity();
  void releaseProximity();
  void onProximity(double value);
  void recover();
  void notify(NoticeID id, NotifySeverity severity, const char* message);

  SessionStore& store;
  IPositionSource& position;
  IRideStorage& storage;
  ICalibrationStore* calibration;
  const IClock& clock;
  INotifier* notifier;
  IProximitySource* proximity;
  std::string orientationPreference;

  MotionSampler motion;
  OrientationSampler orientation;
  SensorSubscription proximityWatch;  // only held while ACTIVE
};

const char* recorderStateToString(RecorderState state);
const char* stopStatusToString(StopStatus status);
const char* startResultToString(StartResult result);

#endif  // INC_APEX_RECORDER_H_
