#include "apex/notification.h"

#include <stdarg.h>
#include <stdio.h>

#include "apex/debug_log.h"

void MultiNotifier::addSink(INotifier* sink) {
  if (sink != nullptr) {
    sinks.push_back(sink);
  }
}

void MultiNotifier::notify(const Notification& notice) {
  for (auto* sink : sinks) {
    sink->notify(notice);
  }
}

void ConsoleNotifier::notify(const Notification& notice) {
  const LogLevel level = notice.severity == NotifySeverity::CAUTION ? LogLevel::WARN : LogLevel::INFO;
  apexLog(level, "Notify", "%s: %s", noticeIDToString(notice.id), notice.message);
}

void NotificationQueue::notify(const Notification& notice) {
  std::lock_guard<std::mutex> lock(mutex);
  if (pending.size() >= depth) {
    apexLog(LogLevel::DEBUG, "Notify", "Queue full, dropping %s", noticeIDToString(notice.id));
    return;
  }
  pending.push_back(notice);
}

bool NotificationQueue::pop(Notification* out) {
  std::lock_guard<std::mutex> lock(mutex);
  if (pending.empty() || out == nullptr) {
    return false;
  }
  *out = pending.front();
  pending.pop_front();
  return true;
}

size_t NotificationQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return pending.size();
}

Notification makeNotification(NoticeID id, NotifySeverity severity, const char* fmt, ...) {
  Notification notice = {};
  notice.id = id;
  notice.severity = severity;

  va_list args;
  va_start(args, fmt);
  vsnprintf(notice.message, sizeof(notice.message), fmt, args);
  va_end(args);
  return notice;
}

const char* noticeIDToString(NoticeID id) {
  switch (id) {
    case NoticeID::PERMISSION_DENIED: return "PERMISSION_DENIED";
    case NoticeID::MOTION_UNAVAILABLE: return "MOTION_UNAVAILABLE";
    case NoticeID::AUTO_PAUSED: return "AUTO_PAUSED";
    case NoticeID::RIDE_SAVED: return "RIDE_SAVED";
    case NoticeID::SAVE_FAILED: return "SAVE_FAILED";
  }
  return "UNKNOWN";
}
