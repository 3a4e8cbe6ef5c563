// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_CLOCK_H_
#define INC_APEX_CLOCK_H_

#include <cstdint>

// Time source for the recording engine. Everything that stamps samples or
// evaluates a deadline goes through this so replay and tests control time.
class IClock {
 public:
  virtual ~IClock() = default;
  virtual int64_t nowMs() const = 0;  // epoch milliseconds
};

// Wall clock
class SystemClock : public IClock {
 public:
  int64_t nowMs() const override;
};

// Clock that only moves when told to (replay files, unit tests)
class ManualClock : public IClock {
 public:
  explicit ManualClock(int64_t startMs = 0) : now(startMs) {}

  int64_t nowMs() const override { return now; }
  void set(int64_t ms) { now = ms; }
  void advance(int64_t ms) { now += ms; }

 private:
  int64_t now;
};

// Milliseconds since the process started, used to stamp log lines
unsigned long uptimeMillis();

#endif  // INC_APEX_CLOCK_H_
