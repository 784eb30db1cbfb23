#include "hal/ArduinoHal.h"

LedcPwmOutput::LedcPwmOutput(uint8_t pin, uint32_t freq_hz, uint8_t resolution_bits)
: _pin(pin),
  _freq_hz(freq_hz),
  _resolution_bits(resolution_bits)
{
  if (_resolution_bits == 0) _resolution_bits = 8;
  if (_resolution_bits > 16) _resolution_bits = 16;
  _max_duty = (1UL << _resolution_bits) - 1UL;
}

bool LedcPwmOutput::begin() {
  _attached = ledcAttach(_pin, _freq_hz, _resolution_bits);
  if (!_attached) return false;
  return write(0.0f);
}

bool LedcPwmOutput::write(float duty) {
  if (!_attached) return false;

  if (duty < 0.0f) duty = 0.0f;
  if (duty > 1.0f) duty = 1.0f;

  const uint32_t raw = (uint32_t)(duty * (float)_max_duty + 0.5f);
  if (!ledcWrite(_pin, raw)) return false;

  _duty_cmd = raw;
  return true;
}

void GpioOutput::begin() {
  pinMode(_pin, OUTPUT);
  digitalWrite(_pin, LOW);
}

void GpioOutput::write(bool high) {
  digitalWrite(_pin, high ? HIGH : LOW);
}
