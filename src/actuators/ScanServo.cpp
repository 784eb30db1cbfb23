// src/actuators/ScanServo.cpp
#include "actuators/ScanServo.h"

ScanServo::ScanServo(uint8_t pin,
                     int min_deg,
                     int max_deg,
                     uint16_t min_pulse_us,
                     uint16_t max_pulse_us)
: _pin(pin),
  _min_deg(min_deg),
  _max_deg(max_deg),
  _min_pulse_us(min_pulse_us),
  _max_pulse_us(max_pulse_us)
{
  // Guard against swapped bounds
  if (_max_deg < _min_deg) {
    int tmp = _max_deg;
    _max_deg = _min_deg;
    _min_deg = tmp;
  }
}

bool ScanServo::begin(int initial_deg) {
  _servo.setPeriodHertz(50);

  // attach() returns the allocated channel, 0 on failure
  if (_servo.attach(_pin, _min_pulse_us, _max_pulse_us) == 0) {
    _state.is_attached = false;
    return false;
  }
  _state.is_attached = true;

  writeDeg(initial_deg);
  return true;
}

void ScanServo::detach() {
  if (!_state.is_attached) return;
  _servo.detach();
  _state.is_attached = false;
}

void ScanServo::writeDeg(int deg) {
  const int d = clampDeg_(deg);
  const uint16_t us = degToPulseUs_(d);

  if (_state.is_attached) {
    _servo.writeMicroseconds(us);
  }

  _state.current_deg = d;
  _state.pulse_us = us;
}

int ScanServo::clampDeg_(int deg) const {
  if (deg < _min_deg) return _min_deg;
  if (deg > _max_deg) return _max_deg;
  return deg;
}

uint16_t ScanServo::degToPulseUs_(int deg) const {
  const int span_deg = _max_deg - _min_deg;
  if (span_deg <= 0) return _min_pulse_us;

  const float frac = (float)(deg - _min_deg) / (float)span_deg;
  const float span_us = (float)(_max_pulse_us - _min_pulse_us);
  return (uint16_t)(_min_pulse_us + frac * span_us + 0.5f);
}
