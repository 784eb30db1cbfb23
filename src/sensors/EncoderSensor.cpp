#include "sensors/EncoderSensor.h"

/*
===============================================================================
  EncoderSensor.cpp
===============================================================================

  Raw pulses are counted here; position and speed are derived in sample().
  Distance is informational only (no closed-loop use).
===============================================================================
*/

EncoderSensor::EncoderSensor()
: EncoderSensor(Config())
{
}

EncoderSensor::EncoderSensor(const Config& cfg)
: _cfg(cfg)
{
  if (_cfg.pulses_per_rev <= 0.0f) {
    _cfg.pulses_per_rev = 1.0f;
  }
}

bool EncoderSensor::onPulseEdge(bool phase_high, uint32_t now_us) {
  if (_have_edge && (uint32_t)(now_us - _last_edge_us) < _cfg.debounce_us) {
    _rejected++;
    return false;
  }
  _have_edge = true;
  _last_edge_us = now_us;

  int8_t dir = phase_high ? -1 : 1;
  if (_cfg.invert_direction) dir = (int8_t)-dir;

  std::lock_guard<std::mutex> lock(_count_mutex);
  _count += dir;
  _last_direction = dir;
  return true;
}

int32_t EncoderSensor::getCount() const {
  std::lock_guard<std::mutex> lock(_count_mutex);
  return _count;
}

int8_t EncoderSensor::lastDirection() const {
  std::lock_guard<std::mutex> lock(_count_mutex);
  return _last_direction;
}

float EncoderSensor::revolutions() const {
  return countsToRev_(getCount());
}

float EncoderSensor::distanceCm() const {
  return revolutions() * _cfg.wheel_circumference_cm;
}

void EncoderSensor::reset(int32_t new_count) {
  {
    std::lock_guard<std::mutex> lock(_count_mutex);
    _count = new_count;
  }

  _state = State();
  _state.count = new_count;
  _state.revolutions = countsToRev_(new_count);
  _state.distance_cm = _state.revolutions * _cfg.wheel_circumference_cm;

  _last_sample_count = new_count;
  _sampled_once = false;
}

void EncoderSensor::sample(uint32_t now_ms) {
  const int32_t count_now = getCount();

  if (!_sampled_once) {
    // First sample only establishes the baseline
    _sampled_once = true;
    _last_sample_count = count_now;
    _state.count = count_now;
    _state.delta_counts = 0;
    _state.revolutions = countsToRev_(count_now);
    _state.distance_cm = _state.revolutions * _cfg.wheel_circumference_cm;
    _state.last_sample_ms = now_ms;
    _state.valid_speed = false;
    return;
  }

  const int32_t dc = count_now - _last_sample_count;
  const uint32_t dt_ms = now_ms - _state.last_sample_ms;

  _state.count = count_now;
  _state.delta_counts = dc;

  _state.revolutions = countsToRev_(count_now);
  _state.distance_cm = _state.revolutions * _cfg.wheel_circumference_cm;

  _state.last_sample_ms = now_ms;
  _last_sample_count = count_now;

  if (dt_ms == 0) {
    _state.valid_speed = false;
    return;
  }

  const float dt_s = (float)dt_ms / 1000.0f;
  const float d_rev = countsToRev_(dc);

  _state.rpm = d_rev / dt_s * 60.0f;
  _state.speed_cmps = d_rev * _cfg.wheel_circumference_cm / dt_s;
  _state.valid_speed = true;
}
