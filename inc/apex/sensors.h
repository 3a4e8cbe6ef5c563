// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_SENSORS_H_
#define INC_APEX_SENSORS_H_

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * Platform sensor capabilities
 *
 * Position: permission check/request plus a watch with options.
 * Orientation: one interface, two hardware flavours (raw accelerometer
 * vector or device-motion event), picked once per subscription.
 * Feed* classes are push-driven implementations used by the host
 * recorder and the tests.
 */

enum class PermissionState : uint8_t {
  GRANTED,
  DENIED,
  UNAVAILABLE
};

struct WatchOptions {
  bool highAccuracy;
  int64_t timeoutMs;
  int64_t maximumAgeMs;
};

// High accuracy, GPS_TIMEOUT_MS, cached fixes up to GPS_MAX_FIX_AGE_MS
WatchOptions defaultWatchOptions();

struct PositionFix {
  double latitude;
  double longitude;
  std::optional<double> speed;  // m/s as reported, may be missing
};

// Acceleration including gravity, m/s^2. Axes the platform did not report
// are left empty.
struct AccelerationSample {
  std::optional<double> x;
  std::optional<double> y;
  std::optional<double> z;
};

using PositionCallback = std::function<void(const PositionFix&)>;
using SensorErrorCallback = std::function<void(const std::string&)>;
using AccelerationCallback = std::function<void(const AccelerationSample&)>;
// Proximity reading; any value above zero means something is near
using ProximityCallback = std::function<void(double)>;

constexpr int INVALID_WATCH_ID = -1;

class IPositionSource {
 public:
  virtual ~IPositionSource() = default;
  virtual PermissionState checkPermission() = 0;
  virtual PermissionState requestPermission() = 0;
  // Returns INVALID_WATCH_ID when the watch could not be started
  virtual int watch(const WatchOptions& options, PositionCallback onFix,
                    SensorErrorCallback onError) = 0;
  virtual void clearWatch(int id) = 0;
};

class IOrientationSource {
 public:
  virtual ~IOrientationSource() = default;
  virtual const char* name() const = 0;
  virtual bool available() const = 0;
  virtual PermissionState requestPermission() = 0;
  // Returns INVALID_WATCH_ID when the listener could not be attached
  virtual int subscribe(AccelerationCallback onSample) = 0;
  virtual void unsubscribe(int id) = 0;
};

class IProximitySource {
 public:
  virtual ~IProximitySource() = default;
  virtual bool available() const = 0;
  // Returns INVALID_WATCH_ID when the listener could not be attached
  virtual int subscribe(ProximityCallback onReading) = 0;
  virtual void unsubscribe(int id) = 0;
};

// Scoped sensor registration. Releases on destruction or reset().
class SensorSubscription {
 public:
  SensorSubscription() = default;
  explicit SensorSubscription(std::function<void()> release) : releaseFn(std::move(release)) {}
  ~SensorSubscription() { reset(); }

  SensorSubscription(SensorSubscription&& other) noexcept : releaseFn(std::move(other.releaseFn)) {
    other.releaseFn = nullptr;
  }
  SensorSubscription& operator=(SensorSubscription&& other) noexcept;

  SensorSubscription(const SensorSubscription&) = delete;
  SensorSubscription& operator=(const SensorSubscription&) = delete;

  void reset();
  bool active() const { return static_cast<bool>(releaseFn); }

 private:
  std::function<void()> releaseFn;
};

SensorSubscription watchPosition(IPositionSource* source, const WatchOptions& options,
                                 PositionCallback onFix, SensorErrorCallback onError);
SensorSubscription listenOrientation(IOrientationSource* source, AccelerationCallback onSample);
SensorSubscription listenProximity(IProximitySource* source, ProximityCallback onReading);

// --- Push-driven implementations ---

/**
 * Listener table shared by the feed sources.
 *
 * Delivery runs outside the table lock. remove() blocks until calls to that
 * entry running on other threads have returned, so the owner of a callback
 * can be destroyed right after releasing it. A callback may remove itself.
 */
template <typename Callback>
class CallbackRegistry {
 public:
  int add(Callback cb) {
    auto slot = std::make_shared<Slot>();
    slot->cb = std::move(cb);
    std::lock_guard<std::mutex> lock(mutex);
    const int id = nextId++;
    slots[id] = std::move(slot);
    return id;
  }

  void remove(int id) {
    std::unique_lock<std::mutex> lock(mutex);
    auto it = slots.find(id);
    if (it == slots.end()) return;
    std::shared_ptr<Slot> slot = it->second;
    slots.erase(it);
    slot->alive = false;

    const std::thread::id self = std::this_thread::get_id();
    idle.wait(lock, [&slot, self]() {
      for (const auto& caller : slot->callers) {
        if (caller != self) return false;
      }
      return true;
    });
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return slots.size();
  }

  // Invoke fn(callback) for every entry still registered when its turn comes
  template <typename Fn>
  void forEach(Fn&& fn) {
    std::vector<std::shared_ptr<Slot>> pending;
    {
      std::lock_guard<std::mutex> lock(mutex);
      pending.reserve(slots.size());
      for (const auto& entry : slots) pending.push_back(entry.second);
    }

    const std::thread::id self = std::this_thread::get_id();
    for (const auto& slot : pending) {
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (!slot->alive) continue;
        slot->callers.push_back(self);
      }
      fn(slot->cb);
      {
        std::lock_guard<std::mutex> lock(mutex);
        slot->callers.erase(std::find(slot->callers.begin(), slot->callers.end(), self));
      }
      idle.notify_all();
    }
  }

 private:
  struct Slot {
    Callback cb;
    bool alive = true;
    std::vector<std::thread::id> callers;  // threads currently inside cb
  };

  mutable std::mutex mutex;
  std::condition_variable idle;
  std::map<int, std::shared_ptr<Slot>> slots;
  int nextId = 1;
};

class FeedPositionSource : public IPositionSource {
 public:
  PermissionState checkPermission() override;
  PermissionState requestPermission() override;
  int watch(const WatchOptions& options, PositionCallback onFix,
            SensorErrorCallback onError) override;
  void clearWatch(int id) override;

  // Current grant, and what a request would resolve to
  void setPermission(PermissionState state);
  void setRequestResult(PermissionState state);

  void pushFix(const PositionFix& fix);
  void pushError(const std::string& message);

  size_t watcherCount() const { return watchers.size(); }
  std::optional<WatchOptions> lastOptions() const;

 private:
  struct Watcher {
    PositionCallback onFix;
    SensorErrorCallback onError;
  };

  mutable std::mutex mutex;
  PermissionState permission = PermissionState::GRANTED;
  PermissionState requestResult = PermissionState::GRANTED;
  std::optional<WatchOptions> options;
  CallbackRegistry<Watcher> watchers;
};

// Native accelerometer: [x, y, z] vectors at UI cadence, no runtime grant
class AccelerometerSource : public IOrientationSource {
 public:
  explicit AccelerometerSource(bool isAvailable = true) : isAvailable(isAvailable) {}

  const char* name() const override { return "accelerometer"; }
  bool available() const override { return isAvailable; }
  PermissionState requestPermission() override;
  int subscribe(AccelerationCallback onSample) override;
  void unsubscribe(int id) override;

  void setAvailable(bool value) { isAvailable = value; }
  // Vectors shorter than three values leave the missing axes empty
  void pushValues(const std::vector<double>& values);
  size_t listenerCount() const { return listeners.size(); }

 private:
  bool isAvailable;
  CallbackRegistry<AccelerationCallback> listeners;
};

// Device-motion events: accelerationIncludingGravity, may need a grant
class DeviceMotionSource : public IOrientationSource {
 public:
  const char* name() const override { return "devicemotion"; }
  bool available() const override { return isAvailable; }
  PermissionState requestPermission() override { return permission; }
  int subscribe(AccelerationCallback onSample) override;
  void unsubscribe(int id) override;

  void setAvailable(bool value) { isAvailable = value; }
  void setPermission(PermissionState state) { permission = state; }
  void pushMotion(const AccelerationSample& sample);
  size_t listenerCount() const { return listeners.size(); }

 private:
  bool isAvailable = true;
  PermissionState permission = PermissionState::GRANTED;
  CallbackRegistry<AccelerationCallback> listeners;
};

class FeedProximitySource : public IProximitySource {
 public:
  explicit FeedProximitySource(bool isAvailable = true) : isAvailable(isAvailable) {}

  bool available() const override { return isAvailable; }
  int subscribe(ProximityCallback onReading) override;
  void unsubscribe(int id) override;

  void setAvailable(bool value) { isAvailable = value; }
  void pushValue(double value);
  size_t listenerCount() const { return listeners.size(); }

 private:
  bool isAvailable;
  CallbackRegistry<ProximityCallback> listeners;
};

/**
 * Pick the orientation source for one subscription.
 *
 * @param preference "accelerometer", "devicemotion" or "auto" (accelerometer first)
 * @return nullptr when neither source is usable
 */
IOrientationSource* selectOrientationSource(const std::string& preference,
                                            IOrientationSource* accelerometer,
                                            IOrientationSource* deviceMotion);

const char* permissionStateToString(PermissionState state);

#endif  // INC_APEX_SENSORS_H_
