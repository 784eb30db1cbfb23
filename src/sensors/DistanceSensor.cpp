#include "sensors/DistanceSensor.h"
#include <HCSR04.h>  // Martinsos library

/*
  DistanceSensor.cpp

  This is a simple wrapper around the Martinsos HC-SR04 library.

  Responsibilities:
  - Take one measurement per measureCm() call
  - Validate the reading against the configured window
  - Store the latest state for telemetry

  Callers serialize access (RangeScanner holds a lock around measureCm()).
*/

DistanceSensor::DistanceSensor(uint8_t trig_pin,
                               uint8_t echo_pin,
                               uint16_t max_distance_cm,
                               uint32_t max_timeout_us,
                               float min_valid_cm,
                               float max_valid_cm)
{
  _min_valid_cm = min_valid_cm;
  _max_valid_cm = max_valid_cm;

  // Martinsos constructor sets pinMode() internally
  _sonar = new UltraSonicDistanceSensor(
      trig_pin,
      echo_pin,
      max_distance_cm,
      max_timeout_us
  );
}

DistanceSensor::~DistanceSensor() {
  if (_sonar) {
    delete _sonar;
    _sonar = nullptr;
  }
}

void DistanceSensor::begin() {
  // Nothing required here, but kept for consistency
}

bool DistanceSensor::measureCm(float& cm_out) {
  const uint32_t now_ms = millis();

  // Safety: ensure sonar exists
  if (!_sonar) {
    _state.valid = false;
    _state.raw_cm = -1.0f;
    _state.last_update_ms = now_ms;
    return false;
  }

  float cm = _sonar->measureDistanceCm();

  _state.last_update_ms = now_ms;
  _state.raw_cm = cm;

  // Library returns -1.0 when no echo came back inside the range window:
  // nothing in front of the sensor, report the far edge of the range.
  if (cm <= 0.0f) {
    cm = _max_valid_cm;
    _state.no_echo_count++;
  }

  if (cm < _min_valid_cm) cm = _min_valid_cm;
  if (cm > _max_valid_cm) cm = _max_valid_cm;

  _state.distance_cm = cm;
  _state.valid = true;
  cm_out = cm;
  return true;
}
