// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_DEBUG_LOG_H_
#define INC_APEX_DEBUG_LOG_H_

#include <cstdio>

/**
 * Console diagnostics.
 *
 * Lines are written as "[uptime_ms] [LEVEL] tag: message", printf style,
 * to stderr by default so stdout stays free for the command protocol.
 */

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
  NONE = 4
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

/** Redirect log output (nullptr restores stderr). */
void setLogStream(FILE* stream);

/** Parse "debug", "info", "warn", "error" or "none". Unknown names return fallback. */
LogLevel logLevelFromString(const char* name, LogLevel fallback);
const char* logLevelToString(LogLevel level);

void apexLog(LogLevel level, const char* tag, const char* fmt, ...)
  __attribute__((format(printf, 3, 4)));

#endif  // INC_APEX_DEBUG_LOG_H_
