#pragma once
#include <stdint.h>
#include <mutex>

#include "Params.h"

/*
===============================================================================
  EncoderSensor.h
===============================================================================

  PURPOSE
  -------
  Pulse + phase quadrature decoder for one wheel, providing:
    - signed accumulated tick count (lock-guarded)
    - direction of the last accepted pulse
    - informational odometry (revolutions, distance, speed)

  DECODE
  ------
  On every rising edge of the pulse channel the phase channel level is
  sampled:
    phase LOW  -> +1 (forward)
    phase HIGH -> -1 (reverse)
  Edges closer than debounce_us to the last accepted edge are dropped.

  THREADING
  ---------
  - onPulseEdge() has exactly one caller: the encoder's producer task
    (see EncoderInput). Debounce bookkeeping is owned by that caller.
  - getCount() / lastDirection() / distanceCm() may be called from any
    thread. The critical section is the single add-and-store.
  - sample() / getState() belong to the loop() that publishes odometry.
===============================================================================
*/

class EncoderSensor {
public:
  struct Config {
    float pulses_per_rev = ENCODER_PULSES_PER_REV;
    float wheel_circumference_cm = WHEEL_CIRCUMFERENCE_CM;
    uint32_t debounce_us = ENCODER_DEBOUNCE_US;

    // Set true if forward physical motion reads as negative count
    bool invert_direction = false;
  };

  struct State {
    int32_t count = 0;             // signed accumulated ticks
    int32_t delta_counts = 0;      // ticks since last sample

    float revolutions = 0.0f;      // wheel revolutions
    float distance_cm = 0.0f;      // linear travel

    float rpm = 0.0f;              // revolutions per minute
    float speed_cmps = 0.0f;       // linear speed, cm/s

    uint32_t last_sample_ms = 0;   // timestamp of last sample
    bool valid_speed = false;      // false until first valid dt > 0 sample
  };

  EncoderSensor();
  explicit EncoderSensor(const Config& cfg);

  /*
    Pulse channel rising edge.

    phase_high:
      Level of the phase channel at the edge.

    now_us:
      Edge timestamp (micros()). Wraps every ~71 minutes; debounce uses
      unsigned differences so the wrap is harmless.

    Returns false if the edge was rejected as bounce.
  */
  bool onPulseEdge(bool phase_high, uint32_t now_us);

  int32_t getCount() const;
  int8_t lastDirection() const;

  // count / pulses_per_rev * wheel circumference
  float distanceCm() const;
  float revolutions() const;

  // Bench helper. The drive core never resets counts.
  void reset(int32_t new_count = 0);

  // Snapshot count and derive speed since the previous sample.
  void sample(uint32_t now_ms);
  const State& getState() const { return _state; }

  uint32_t rejectedEdges() const { return _rejected; }
  const Config& config() const { return _cfg; }

private:
  float countsToRev_(int32_t c) const { return (float)c / _cfg.pulses_per_rev; }

  Config _cfg;

  // Guarded by _count_mutex
  int32_t _count = 0;
  int8_t _last_direction = 1;
  mutable std::mutex _count_mutex;

  // Producer-only debounce bookkeeping
  bool _have_edge = false;
  uint32_t _last_edge_us = 0;
  uint32_t _rejected = 0;

  // Sampler-only
  int32_t _last_sample_count = 0;
  bool _sampled_once = false;
  State _state;
};
