#pragma once
#include <Arduino.h>

#include "hal/HardwareInterfaces.h"

/*
  ArduinoHal

  ESP32 implementations of the hardware seams:
  - LedcPwmOutput : one LEDC-driven pin (arduino-esp32 3.x pin-based API)
  - GpioOutput    : plain digitalWrite pin
  - ArduinoClock  : millis() / delay() (delay yields to FreeRTOS)
*/

class LedcPwmOutput : public PwmOutput {
public:
  LedcPwmOutput(uint8_t pin, uint32_t freq_hz, uint8_t resolution_bits);

  // Attach the pin to an LEDC channel and drive 0% duty.
  bool begin();

  bool write(float duty) override;

  uint32_t dutyCmd() const { return _duty_cmd; }

private:
  uint8_t _pin;
  uint32_t _freq_hz;
  uint8_t _resolution_bits;
  uint32_t _max_duty;

  bool _attached = false;
  uint32_t _duty_cmd = 0;
};

class GpioOutput : public DigitalOutput {
public:
  explicit GpioOutput(uint8_t pin) : _pin(pin) {}

  // Configure as output and drive LOW.
  void begin();

  void write(bool high) override;

private:
  uint8_t _pin;
};

class ArduinoClock : public Clock {
public:
  uint32_t nowMs() override { return millis(); }
  void sleepMs(uint32_t ms) override { delay(ms); }
};
