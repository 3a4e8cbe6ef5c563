#include "apex/sensors.h"

#include <utility>

#include "apex/debug_log.h"
#include "apex/ride_config.h"

WatchOptions defaultWatchOptions() {
  WatchOptions options = {};
  options.highAccuracy = GPS_HIGH_ACCURACY;
  options.timeoutMs = GPS_TIMEOUT_MS;
  options.maximumAgeMs = GPS_MAX_FIX_AGE_MS;
  return options;
}

// --- SensorSubscription ---

SensorSubscription& SensorSubscription::operator=(SensorSubscription&& other) noexcept {
  if (this != &other) {
    reset();
    releaseFn = std::move(other.releaseFn);
    other.releaseFn = nullptr;
  }
  return *this;
}

void SensorSubscription::reset() {
  if (releaseFn) {
    auto release = std::move(releaseFn);
    releaseFn = nullptr;
    release();
  }
}

SensorSubscription watchPosition(IPositionSource* source, const WatchOptions& options,
                                 PositionCallback onFix, SensorErrorCallback onError) {
  if (source == nullptr) return SensorSubscription();
  const int id = source->watch(options, std::move(onFix), std::move(onError));
  if (id == INVALID_WATCH_ID) {
    apexLog(LogLevel::WARN, "Sensors", "Position watch could not be started");
    return SensorSubscription();
  }
  return SensorSubscription([source, id]() { source->clearWatch(id); });
}

SensorSubscription listenOrientation(IOrientationSource* source, AccelerationCallback onSample) {
  if (source == nullptr) return SensorSubscription();
  const int id = source->subscribe(std::move(onSample));
  if (id == INVALID_WATCH_ID) {
    apexLog(LogLevel::WARN, "Sensors", "Could not attach to %s", source->name());
    return SensorSubscription();
  }
  return SensorSubscription([source, id]() { source->unsubscribe(id); });
}

SensorSubscription listenProximity(IProximitySource* source, ProximityCallback onReading) {
  if (source == nullptr) return SensorSubscription();
  const int id = source->subscribe(std::move(onReading));
  if (id == INVALID_WATCH_ID) {
    apexLog(LogLevel::DEBUG, "Sensors", "Proximity sensor not available");
    return SensorSubscription();
  }
  return SensorSubscription([source, id]() { source->unsubscribe(id); });
}

// --- FeedPositionSource ---

PermissionState FeedPositionSource::checkPermission() {
  std::lock_guard<std::mutex> lock(mutex);
  return permission;
}

PermissionState FeedPositionSource::requestPermission() {
  std::lock_guard<std::mutex> lock(mutex);
  if (permission != PermissionState::GRANTED) {
    permission = requestResult;
  }
  return permission;
}

int FeedPositionSource::watch(const WatchOptions& watchOptions, PositionCallback onFix,
                              SensorErrorCallback onError) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (permission != PermissionState::GRANTED) return INVALID_WATCH_ID;
    options = watchOptions;
  }
  return watchers.add(Watcher{std::move(onFix), std::move(onError)});
}

void FeedPositionSource::clearWatch(int id) {
  watchers.remove(id);
}

void FeedPositionSource::setPermission(PermissionState state) {
  std::lock_guard<std::mutex> lock(mutex);
  permission = state;
}

void FeedPositionSource::setRequestResult(PermissionState state) {
  std::lock_guard<std::mutex> lock(mutex);
  requestResult = state;
}

void FeedPositionSource::pushFix(const PositionFix& fix) {
  watchers.forEach([&fix](const Watcher& w) {
    if (w.onFix) w.onFix(fix);
  });
}

void FeedPositionSource::pushError(const std::string& message) {
  watchers.forEach([&message](const Watcher& w) {
    if (w.onError) w.onError(message);
  });
}

std::optional<WatchOptions> FeedPositionSource::lastOptions() const {
  std::lock_guard<std::mutex> lock(mutex);
  return options;
}

// --- AccelerometerSource ---

PermissionState AccelerometerSource::requestPermission() {
  return isAvailable ? PermissionState::GRANTED : PermissionState::UNAVAILABLE;
}

int AccelerometerSource::subscribe(AccelerationCallback onSample) {
  if (!isAvailable) return INVALID_WATCH_ID;
  return listeners.add(std::move(onSample));
}

void AccelerometerSource::unsubscribe(int id) {
  listeners.remove(id);
}

void AccelerometerSource::pushValues(const std::vector<double>& values) {
  AccelerationSample sample;
  if (values.size() > 0) sample.x = values[0];
  if (values.size() > 1) sample.y = values[1];
  if (values.size() > 2) sample.z = values[2];
  listeners.forEach([&sample](const AccelerationCallback& cb) {
    if (cb) cb(sample);
  });
}

// --- DeviceMotionSource ---

int DeviceMotionSource::subscribe(AccelerationCallback onSample) {
  if (!isAvailable || permission != PermissionState::GRANTED) return INVALID_WATCH_ID;
  return listeners.add(std::move(onSample));
}

void DeviceMotionSource::unsubscribe(int id) {
  listeners.remove(id);
}

void DeviceMotionSource::pushMotion(const AccelerationSample& sample) {
  listeners.forEach([&sample](const AccelerationCallback& cb) {
    if (cb) cb(sample);
  });
}

// --- FeedProximitySource ---

int FeedProximitySource::subscribe(ProximityCallback onReading) {
  if (!isAvailable) return INVALID_WATCH_ID;
  return listeners.add(std::move(onReading));
}

void FeedProximitySource::unsubscribe(int id) {
  listeners.remove(id);
}

void FeedProximitySource::pushValue(double value) {
  listeners.forEach([value](const ProximityCallback& cb) {
    if (cb) cb(value);
  });
}

IOrientationSource* selectOrientationSource(const std::string& preference,
                                            IOrientationSource* accelerometer,
                                            IOrientationSource* deviceMotion) {
  auto usable = [](IOrientationSource* source) {
    return source != nullptr && source->available();
  };

  if (preference == "accelerometer") {
    return usable(accelerometer) ? accelerometer : nullptr;
  }
  if (preference == "devicemotion") {
    return usable(deviceMotion) ? deviceMotion : nullptr;
  }
  if (usable(accelerometer)) return accelerometer;
  if (usable(deviceMotion)) return deviceMotion;
  return nullptr;
}

const char* permissionStateToString(PermissionState state) {
  switch (state) {
    case PermissionState::GRANTED: return "granted";
    case PermissionState::DENIED: return "denied";
    case PermissionState::UNAVAILABLE: return "unavailable";
  }
  return "unknown";
}
