// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_NOTIFICATION_H_
#define INC_APEX_NOTIFICATION_H_

#include <stdint.h>

#include <deque>
#include <mutex>
#include <vector>

#include "apex/ride_config.h"

enum class NotifySeverity {
  INFO,
  CAUTION
};

// User-facing signals raised by the recording engine
enum class NoticeID {
  PERMISSION_DENIED,
  MOTION_UNAVAILABLE,
  AUTO_PAUSED,
  RIDE_SAVED,
  SAVE_FAILED
};

struct Notification {
  NoticeID id;
  NotifySeverity severity;
  char message[NOTICE_MESSAGE_LEN];
};

// Notice sink interface
class INotifier {
 public:
  virtual ~INotifier() = default;
  virtual void notify(const Notification& notice) = 0;
};

// Fans one notice out to every registered sink
class MultiNotifier : public INotifier {
 private:
  std::vector<INotifier*> sinks;

 public:
  void addSink(INotifier* sink);
  void notify(const Notification& notice) override;
};

// Writes notices to the debug log
class ConsoleNotifier : public INotifier {
 public:
  void notify(const Notification& notice) override;
};

// Bounded FIFO of pending notices for a front end to drain.
// Drops the new notice when full.
class NotificationQueue : public INotifier {
 public:
  explicit NotificationQueue(size_t depth = NOTICE_QUEUE_DEPTH) : depth(depth) {}

  void notify(const Notification& notice) override;
  bool pop(Notification* out);
  size_t size() const;

 private:
  size_t depth;
  mutable std::mutex mutex;
  std::deque<Notification> pending;
};

// Build a notice with a printf style message (truncated to NOTICE_MESSAGE_LEN)
Notification makeNotification(NoticeID id, NotifySeverity severity, const char* fmt, ...)
  __attribute__((format(printf, 3, 4)));

const char* noticeIDToString(NoticeID id);

#endif  // INC_APEX_NOTIFICATION_H_
