#pragma once

#include <stdint.h>

/*
  Rate

  Fixed-period scheduler for the cooperative loop():
    if (g_telemetry_rate.ready(now_ms)) { ... }

  First call to ready() fires immediately. Overruns do not accumulate:
  the next deadline is always "now + period".
*/

class Rate {
public:
  // hz = how many times per second you want to run
  explicit Rate(uint16_t hz = 1) { setHz(hz); }

  void setHz(uint16_t hz) {
    if (hz == 0) hz = 1;
    setPeriodMs(1000UL / hz);
  }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // Returns true when it's time to run. If true, it schedules the next tick.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;
      _initialized = true;
    }

    // Signed difference keeps this correct across millis() rollover
    if ((int32_t)(now_ms - _next_ms) >= 0) {
      _next_ms = now_ms + _period_ms;
      return true;
    }
    return false;
  }

  // Forget the schedule; the next ready() fires immediately.
  void reset() { _initialized = false; }

  uint32_t periodMs() const { return _period_ms; }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  bool _initialized = false;
};
