#pragma once
#include <stdint.h>

/*
===============================================================================
  HardwareInterfaces.h
===============================================================================

  PURPOSE
  -------
  Minimal seams between the control core and the board.

  The control classes (MotorDriver, RangeScanner, DriveController,
  AutoController, CommandRouter) only talk to these interfaces, so the same
  code runs on the ESP32 (hal/ArduinoHal.h, ScanServo, DistanceSensor) and
  against fakes in the host unit tests.
===============================================================================
*/

// One PWM output. duty is normalized to [0.0, 1.0].
class PwmOutput {
public:
  virtual ~PwmOutput() {}

  // Returns false if the peripheral rejected the write.
  virtual bool write(float duty) = 0;
};

// One push-pull digital output.
class DigitalOutput {
public:
  virtual ~DigitalOutput() {}
  virtual void write(bool high) = 0;
};

// Positional actuator for the scan head (degrees, already clamped by caller).
class AngleOutput {
public:
  virtual ~AngleOutput() {}
  virtual void writeDeg(int deg) = 0;
};

// Single-shot distance measurement.
class RangeSource {
public:
  virtual ~RangeSource() {}

  /*
    Triggers one measurement and blocks until it completes.

    Returns:
      - true and sets cm_out when a measurement was taken
      - false if the sensor could not produce a reading
  */
  virtual bool measureCm(float& cm_out) = 0;
};

// Time source and cooperative delay.
class Clock {
public:
  virtual ~Clock() {}
  virtual uint32_t nowMs() = 0;
  virtual void sleepMs(uint32_t ms) = 0;
};
