#pragma once
#include <stdint.h>
#include <mutex>

#include "Params.h"
#include "hal/HardwareInterfaces.h"

// One distance sample tagged with the head angle it was taken at.
struct ScanReading {
  int angle_deg = 0;
  float distance_cm = 0.0f;
  bool valid = false;
};

/*
  RangeScanner

  Purpose:
  Steerable ultrasonic scan head: a servo (AngleOutput) carrying a distance
  sensor (RangeSource).

  - setScanAngle(): one clamped write, no wait
  - sweepTo(): stepped move from the last commanded angle, blocking the
    calling thread for (steps * step_delay_ms). Only one sweep per scanner
    at a time; the autonomous worker is the only sweeping caller.
  - readDistanceCm(): one instantaneous sample, no retry or averaging.
    Reads from different threads are serialized.
*/

class RangeScanner {
public:
  struct Config {
    int min_deg = SCAN_MIN_DEG;
    int max_deg = SCAN_MAX_DEG;
    int default_step_deg = SCAN_STEP_DEG;
    uint32_t default_step_delay_ms = SCAN_STEP_DELAY_MS;
  };

  RangeScanner(AngleOutput& head, RangeSource& sensor, Clock& clock);
  RangeScanner(AngleOutput& head, RangeSource& sensor, Clock& clock, const Config& cfg);

  // Command the head to initial_deg (clamped) and record it.
  void begin(int initial_deg = SCAN_CENTER_DEG);

  // Clamp to [min_deg, max_deg] and command the head. Returns the clamped angle.
  int setScanAngle(int deg);

  // Stepped move to target using the configured step/delay.
  void sweepTo(int target_deg);

  /*
    Stepped move from the last commanded angle to target_deg.

    Every position (start included) is written, then step_delay_ms is
    slept. The final step is shortened so the head lands exactly on the
    clamped target.
  */
  void sweepTo(int target_deg, int step_deg, uint32_t step_delay_ms);

  ScanReading readDistanceCm();

  int currentAngle() const;
  const Config& config() const { return _cfg; }

private:
  int clampDeg_(int deg) const;

  AngleOutput& _head;
  RangeSource& _sensor;
  Clock& _clock;
  Config _cfg;

  // Last commanded angle (written by the sweeping thread, read by telemetry)
  mutable std::mutex _angle_mutex;
  int _angle_deg = SCAN_CENTER_DEG;

  std::mutex _read_mutex;
};
