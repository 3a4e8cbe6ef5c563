#include "apex/session_store.h"

#include "apex/distance.h"

void SessionStore::beginRide(int64_t startTimeMs) {
  std::lock_guard<std::mutex> lock(mutex);
  const uint32_t prevCoordsSeq = state.coordsSeq;
  const uint32_t prevLeanSeq = state.leanSeq;
  state = RideSnapshot();
  state.isRecording = true;
  state.startTime = startTimeMs;
  // Counters keep running across rides so readers never see them go back
  state.coordsSeq = prevCoordsSeq + 1;
  state.leanSeq = prevLeanSeq + 1;
}

void SessionStore::resetRide() {
  std::lock_guard<std::mutex> lock(mutex);
  const uint32_t prevCoordsSeq = state.coordsSeq;
  const uint32_t prevLeanSeq = state.leanSeq;
  state = RideSnapshot();
  state.coordsSeq = prevCoordsSeq + 1;
  state.leanSeq = prevLeanSeq + 1;
}

void SessionStore::clearRecordingFlags() {
  std::lock_guard<std::mutex> lock(mutex);
  state.isRecording = false;
  state.isPaused = false;
}

void SessionStore::setPaused(bool paused) {
  std::lock_guard<std::mutex> lock(mutex);
  state.isPaused = paused && state.isRecording;
}

void SessionStore::setPocketMode(bool on) {
  std::lock_guard<std::mutex> lock(mutex);
  state.isPocketMode = on;
}

bool SessionStore::appendCoordinate(const Coordinate& coord) {
  std::lock_guard<std::mutex> lock(mutex);
  if (!state.isRecording || state.isPaused) return false;

  if (!state.coords.empty()) {
    state.distanceKm += haversineKm(state.coords.back(), coord);
  }
  state.coords.push_back(coord);
  state.coordsSeq++;
  return true;
}

bool SessionStore::applyLean(double currentLean, double maxLeanLeft, double maxLeanRight) {
  std::lock_guard<std::mutex> lock(mutex);
  if (!state.isRecording || state.isPocketMode) return false;

  state.currentLean = currentLean;
  // Peaks never move down within a ride
  if (maxLeanLeft > state.maxLeanLeft) state.maxLeanLeft = maxLeanLeft;
  if (maxLeanRight > state.maxLeanRight) state.maxLeanRight = maxLeanRight;
  state.leanSeq++;
  return true;
}

RideSnapshot SessionStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex);
  return state;
}

bool SessionStore::isRecording() const {
  std::lock_guard<std::mutex> lock(mutex);
  return state.isRecording;
}

bool SessionStore::isPaused() const {
  std::lock_guard<std::mutex> lock(mutex);
  return state.isPaused;
}

bool SessionStore::isPocketMode() const {
  std::lock_guard<std::mutex> lock(mutex);
  return state.isPocketMode;
}

uint32_t SessionStore::coordsSeq() const {
  std::lock_guard<std::mutex> lock(mutex);
  return state.coordsSeq;
}

uint32_t SessionStore::leanSeq() const {
  std::lock_guard<std::mutex> lock(mutex);
  return state.leanSeq;
}
