// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_DEADLINE_H_
#define INC_APEX_DEADLINE_H_

#include <cstdint>

// One-shot deadline evaluated against caller supplied time (epoch ms)
class Deadline {
 public:
  void arm(int64_t atMs) {
    dueAt = atMs;
    isArmed = true;
  }

  void cancel() { isArmed = false; }

  bool armed() const { return isArmed; }
  int64_t due() const { return dueAt; }

  bool expired(int64_t nowMs) const { return isArmed && nowMs >= dueAt; }

 private:
  int64_t dueAt = 0;
  bool isArmed = false;
};

#endif  // INC_APEX_DEADLINE_H_
