// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_LEAN_PROCESSOR_H_
#define INC_APEX_LEAN_PROCESSOR_H_

/**
 * Lean signal pipeline
 *
 * Per raw roll sample, in order:
 * - Subtract the calibration offset
 * - Motion lock: below MOTION_LOCK_SPEED_MS output 0 and reset smoothing
 * - Exponential smoothing with LEAN_SMOOTHING_ALPHA
 * - Clamp the magnitude to LEAN_MAX_DEG
 * Peaks are tracked per side from the sign of the calibrated value.
 */

enum class LeanSide {
  NONE,
  LEFT,
  RIGHT
};

struct LeanSample {
  double calibrated;  // raw - offset (degrees)
  double lean;        // smoothed, clamped magnitude in [0, LEAN_MAX_DEG]
  LeanSide side;
};

/**
 * Roll angle from three-axis acceleration including gravity:
 * atan2(x, sqrt(y^2 + z^2)) in degrees.
 *
 * @return false (outDeg untouched) when any axis is NaN or infinite
 */
bool rollFromAcceleration(double x, double y, double z, double* outDeg);

class LeanProcessor {
 public:
  void setCalibrationOffset(double offsetDeg) { offset = offsetDeg; }
  double calibrationOffset() const { return offset; }

  /**
   * Run one sample through the pipeline and update peaks.
   *
   * @param rawRollDeg Roll reading from the orientation source
   * @param speedMs    Latest speed from the motion sampler (0 when unknown)
   */
  LeanSample process(double rawRollDeg, double speedMs);

  // Seed peaks from an existing session (recovery)
  void restorePeaks(double left, double right);

  /** Zero smoothing state and peaks (new ride). */
  void reset();

  double prevSmoothed() const { return smoothed; }
  double maxLeanLeft() const { return peakLeft; }
  double maxLeanRight() const { return peakRight; }

 private:
  double offset = 0.0;
  double smoothed = 0.0;
  double peakLeft = 0.0;
  double peakRight = 0.0;
};

#endif  // INC_APEX_LEAN_PROCESSOR_H_
