// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_SESSION_STORE_H_
#define INC_APEX_SESSION_STORE_H_

#include <cstdint>
#include <mutex>

#include "apex/structs.h"

// Durable ride session. One instance is created at process start and outlives
// any recorder built on top of it, so a rebuilt recorder sees the same ride.
// Producers (motion sampler, orientation sampler) write disjoint field groups;
// each write is atomic under the store mutex and bumps that group's sequence
// counter.
class SessionStore {
 public:
  SessionStore() = default;
  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  // --- Lifecycle ---

  // Clear every field, then mark recording with a fresh start time
  void beginRide(int64_t startTimeMs);

  // Clear every field (discard or after a successful save)
  void resetRide();

  // Drop recording/paused flags but keep coords and startTime
  void clearRecordingFlags();

  void setPaused(bool paused);
  void setPocketMode(bool on);

  // --- Producers ---

  // Append a sample and extend distanceKm by the haversine step.
  // Returns false (no change) unless recording and not paused.
  bool appendCoordinate(const Coordinate& coord);

  // Store the latest lean value and peaks.
  // Returns false (no change) unless recording or while in pocket mode.
  bool applyLean(double currentLean, double maxLeanLeft, double maxLeanRight);

  // --- Consumers ---

  RideSnapshot snapshot() const;
  bool isRecording() const;
  bool isPaused() const;
  bool isPocketMode() const;
  uint32_t coordsSeq() const;
  uint32_t leanSeq() const;

 private:
  mutable std::mutex mutex;
  RideSnapshot state;
};

#endif  // INC_APEX_SESSION_STORE_H_
