#pragma once

#include <Arduino.h>

#include "hal/HardwareInterfaces.h"

// Forward declaration: we only store a pointer in the header
class UltraSonicDistanceSensor;

/*
  DistanceSensor

  HC-SR04 on the scan head, via the Martinsos HCSR04 library.
  measureCm() blocks for at most the echo timeout.

  Readings are clamped to [min_valid_cm, max_valid_cm]. A missing echo means
  nothing within range and is reported as max_valid_cm. measureCm() only
  fails when the library object could not be created.
*/

class DistanceSensor : public RangeSource {
public:
  struct State {
    float distance_cm = -1.0f;      // last reported distance (-1 until first)
    bool  valid = false;            // last reading valid?
    uint32_t last_update_ms = 0;    // millis() at last measurement
    float raw_cm = -1.0f;           // last raw library value (-1 if no echo)
    uint32_t no_echo_count = 0;     // readings reported as max range
  };

  // max_timeout_us caps blocking time inside pulseIn (0 means "no extra cap").
  DistanceSensor(uint8_t trig_pin,
                 uint8_t echo_pin,
                 uint16_t max_distance_cm = 400,
                 uint32_t max_timeout_us = 30000,
                 float min_valid_cm = 2.0f,
                 float max_valid_cm = 400.0f);

  ~DistanceSensor();

  void begin();                       // consistency hook (library sets pinMode in ctor)

  bool measureCm(float& cm_out) override;

  const State& getState() const { return _state; }

private:
  float _min_valid_cm;
  float _max_valid_cm;

  State _state;

  UltraSonicDistanceSensor* _sonar = nullptr;
};
