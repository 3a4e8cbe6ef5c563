#include "apex/clock.h"

#include <chrono>

int64_t SystemClock::nowMs() const {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  return duration_cast<milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

unsigned long uptimeMillis() {
  static const auto start = std::chrono::steady_clock::now();
  return static_cast<unsigned long>(
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}
