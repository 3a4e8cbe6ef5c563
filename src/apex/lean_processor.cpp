#include "apex/lean_processor.h"

#include <algorithm>
#include <cmath>

#include "apex/ride_config.h"

bool rollFromAcceleration(double x, double y, double z, double* outDeg) {
  if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z) || outDeg == nullptr) {
    return false;
  }
  *outDeg = std::atan2(x, std::sqrt(y * y + z * z)) * 180.0 / M_PI;
  return true;
}

LeanSample LeanProcessor::process(double rawRollDeg, double speedMs) {
  LeanSample sample = {};
  sample.calibrated = rawRollDeg - offset;
  sample.side = LeanSide::NONE;

  // Motion lock: standing still or walking the bike is not leaning
  if (!(speedMs >= MOTION_LOCK_SPEED_MS)) {
    smoothed = 0.0;
    sample.lean = 0.0;
    return sample;
  }

  smoothed = LEAN_SMOOTHING_ALPHA * sample.calibrated + (1.0 - LEAN_SMOOTHING_ALPHA) * smoothed;
  sample.lean = std::min(std::fabs(smoothed), LEAN_MAX_DEG);

  if (sample.lean > 0.0) {
    if (sample.calibrated < 0.0) {
      sample.side = LeanSide::LEFT;
      peakLeft = std::max(peakLeft, sample.lean);
    } else {
      sample.side = LeanSide::RIGHT;
      peakRight = std::max(peakRight, sample.lean);
    }
  }
  return sample;
}

void LeanProcessor::restorePeaks(double left, double right) {
  peakLeft = left;
  peakRight = right;
}

void LeanProcessor::reset() {
  smoothed = 0.0;
  peakLeft = 0.0;
  peakRight = 0.0;
}
