#include "sensors/RangeScanner.h"

RangeScanner::RangeScanner(AngleOutput& head, RangeSource& sensor, Clock& clock)
: RangeScanner(head, sensor, clock, Config())
{
}

RangeScanner::RangeScanner(AngleOutput& head, RangeSource& sensor, Clock& clock, const Config& cfg)
: _head(head),
  _sensor(sensor),
  _clock(clock),
  _cfg(cfg)
{
  // Guard against swapped bounds
  if (_cfg.max_deg < _cfg.min_deg) {
    int tmp = _cfg.max_deg;
    _cfg.max_deg = _cfg.min_deg;
    _cfg.min_deg = tmp;
  }
  if (_cfg.default_step_deg <= 0) _cfg.default_step_deg = 1;
}

void RangeScanner::begin(int initial_deg) {
  setScanAngle(initial_deg);
}

int RangeScanner::clampDeg_(int deg) const {
  if (deg < _cfg.min_deg) return _cfg.min_deg;
  if (deg > _cfg.max_deg) return _cfg.max_deg;
  return deg;
}

int RangeScanner::setScanAngle(int deg) {
  const int d = clampDeg_(deg);
  _head.writeDeg(d);

  std::lock_guard<std::mutex> lock(_angle_mutex);
  _angle_deg = d;
  return d;
}

void RangeScanner::sweepTo(int target_deg) {
  sweepTo(target_deg, _cfg.default_step_deg, _cfg.default_step_delay_ms);
}

void RangeScanner::sweepTo(int target_deg, int step_deg, uint32_t step_delay_ms) {
  if (step_deg < 0) step_deg = -step_deg;
  if (step_deg == 0) step_deg = 1;

  const int target = clampDeg_(target_deg);
  int pos = currentAngle();

  for (;;) {
    setScanAngle(pos);
    _clock.sleepMs(step_delay_ms);

    if (pos == target) break;

    if (target > pos) {
      pos = (target - pos > step_deg) ? (pos + step_deg) : target;
    } else {
      pos = (pos - target > step_deg) ? (pos - step_deg) : target;
    }
  }
}

ScanReading RangeScanner::readDistanceCm() {
  ScanReading r;
  r.angle_deg = currentAngle();

  float cm = 0.0f;
  bool ok;
  {
    std::lock_guard<std::mutex> lock(_read_mutex);
    ok = _sensor.measureCm(cm);
  }

  if (ok && cm >= 0.0f) {
    r.distance_cm = cm;
    r.valid = true;
  }
  return r;
}

int RangeScanner::currentAngle() const {
  std::lock_guard<std::mutex> lock(_angle_mutex);
  return _angle_deg;
}
