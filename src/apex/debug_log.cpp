#include "apex/debug_log.h"

#include <atomic>
#include <cstdarg>
#include <cstring>
#include <mutex>

#include "apex/clock.h"

static std::atomic<LogLevel> gLogLevel{LogLevel::INFO};
static FILE* gLogStream = nullptr;
static std::mutex gLogMutex;

void setLogLevel(LogLevel level) {
  gLogLevel = level;
}

LogLevel getLogLevel() {
  return gLogLevel;
}

void setLogStream(FILE* stream) {
  std::lock_guard<std::mutex> lock(gLogMutex);
  gLogStream = stream;
}

LogLevel logLevelFromString(const char* name, LogLevel fallback) {
  if (name == nullptr) return fallback;
  if (strcmp(name, "debug") == 0) return LogLevel::DEBUG;
  if (strcmp(name, "info") == 0) return LogLevel::INFO;
  if (strcmp(name, "warn") == 0) return LogLevel::WARN;
  if (strcmp(name, "error") == 0) return LogLevel::ERROR;
  if (strcmp(name, "none") == 0) return LogLevel::NONE;
  return fallback;
}

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::NONE: return "NONE";
  }
  return "UNKNOWN";
}

void apexLog(LogLevel level, const char* tag, const char* fmt, ...) {
  if (level < gLogLevel.load() || level == LogLevel::NONE) return;

  char message[256];
  va_list args;
  va_start(args, fmt);
  vsnprintf(message, sizeof(message), fmt, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(gLogMutex);
  FILE* out = gLogStream != nullptr ? gLogStream : stderr;
  fprintf(out, "[%lu] [%s] %s: %s\n", uptimeMillis(), logLevelToString(level),
          tag != nullptr ? tag : "-", message);
  fflush(out);
}
