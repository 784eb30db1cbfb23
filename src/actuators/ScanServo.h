// src/actuators/ScanServo.h
#pragma once

#include <Arduino.h>
#include <ESP32Servo.h>

#include "hal/HardwareInterfaces.h"

/*
  ScanServo

  Purpose:
  - Steer the ultrasonic scan head to a signed angle
    (0 = straight ahead, +right / -left)
  - Map [min_deg, max_deg] linearly onto [min_pulse_us, max_pulse_us]
  - Stay attached so the head holds position between readings

  Pacing is done by the caller (RangeScanner::sweepTo); this class writes
  one position per call and does not block.
*/

class ScanServo : public AngleOutput {
public:
  struct State {
    int current_deg = 0;
    uint16_t pulse_us = 0;
    bool is_attached = false;
  };

  ScanServo(uint8_t pin,
            int min_deg,
            int max_deg,
            uint16_t min_pulse_us,
            uint16_t max_pulse_us);

  // Attach and move to initial_deg (clamped).
  bool begin(int initial_deg);

  // Detach (stop PWM pulses). Servo will not hold position.
  void detach();

  void writeDeg(int deg) override;

  const State& getState() const { return _state; }

private:
  int clampDeg_(int deg) const;
  uint16_t degToPulseUs_(int deg) const;

  Servo _servo;
  uint8_t _pin;

  int _min_deg;
  int _max_deg;
  uint16_t _min_pulse_us;
  uint16_t _max_pulse_us;

  State _state;
};
