#include "actuators/MotorDriver.h"

/*
===============================================================================
  MotorDriver.cpp
===============================================================================

  BTS7960 truth table (per channel, enables HIGH):
    - RPWM=0,   LPWM=0   -> Coast
    - RPWM=PWM, LPWM=0   -> Forward
    - RPWM=0,   LPWM=PWM -> Reverse

  The output being released is always written before the output being
  driven, so RPWM and LPWM are never both nonzero, even transiently.
===============================================================================
*/

MotorDriver::MotorDriver(const ChannelOutputs& a,
                         const ChannelOutputs& b,
                         bool invert_a,
                         bool invert_b)
: _ch_a(a),
  _ch_b(b)
{
  _state[CHANNEL_A].invert = invert_a;
  _state[CHANNEL_B].invert = invert_b;
}

void MotorDriver::begin() {
  disable();
}

float MotorDriver::clampSpeed_(float s) {
  if (s > 1.0f) return 1.0f;
  if (s < -1.0f) return -1.0f;
  return s;
}

void MotorDriver::writePwm_(PwmOutput& out, float duty) {
  if (!out.write(duty)) {
    _output_fault = true;
  }
}

void MotorDriver::setChannelSpeed(Channel ch, float speed) {
  if (ch >= CHANNEL_COUNT) return;

  std::lock_guard<std::mutex> lock(_io_mutex);
  applyLocked_(ch, _enabled ? clampSpeed_(speed) : 0.0f);
}

void MotorDriver::applyLocked_(Channel ch, float speed) {
  ChannelOutputs& out = (ch == CHANNEL_A) ? _ch_a : _ch_b;
  ChannelState& st = _state[ch];

  st.speed_cmd = speed;

  // Optional polarity inversion for mirrored drivetrain sides
  const float duty = st.invert ? -speed : speed;

  if (duty > 0.0f) {
    writePwm_(out.reverse, 0.0f);
    writePwm_(out.forward, duty);
  } else if (duty < 0.0f) {
    writePwm_(out.forward, 0.0f);
    writePwm_(out.reverse, -duty);
  } else {
    writePwm_(out.forward, 0.0f);
    writePwm_(out.reverse, 0.0f);
  }
}

void MotorDriver::enable() {
  std::lock_guard<std::mutex> lock(_io_mutex);

  _ch_a.enable_a.write(true);
  _ch_a.enable_b.write(true);
  _ch_b.enable_a.write(true);
  _ch_b.enable_b.write(true);

  _enabled = true;
}

void MotorDriver::disable() {
  std::lock_guard<std::mutex> lock(_io_mutex);

  // De-energize before dropping the enables
  applyLocked_(CHANNEL_A, 0.0f);
  applyLocked_(CHANNEL_B, 0.0f);

  _ch_a.enable_a.write(false);
  _ch_a.enable_b.write(false);
  _ch_b.enable_a.write(false);
  _ch_b.enable_b.write(false);

  _enabled = false;
}

bool MotorDriver::isEnabled() const {
  std::lock_guard<std::mutex> lock(_io_mutex);
  return _enabled;
}

float MotorDriver::speedCmd(Channel ch) const {
  if (ch >= CHANNEL_COUNT) return 0.0f;
  std::lock_guard<std::mutex> lock(_io_mutex);
  return _state[ch].speed_cmd;
}

bool MotorDriver::outputFault() const {
  std::lock_guard<std::mutex> lock(_io_mutex);
  return _output_fault;
}

void MotorDriver::clearFault() {
  std::lock_guard<std::mutex> lock(_io_mutex);
  _output_fault = false;
}
