#pragma once
#include <stdint.h>
#include <mutex>

#include "hal/HardwareInterfaces.h"

/*
===============================================================================
  MotorDriver.h
===============================================================================

  PURPOSE
  -------
  Hardware wrapper for the two BTS7960 half-bridge pairs driving the left
  and right wheels.

  Per channel wiring:
    - RPWM = forward PWM
    - LPWM = reverse PWM
    - R_EN / L_EN = bridge enables (both must be HIGH to drive)

  Responsibilities:
    - Accept normalized speed command in [-1.0, +1.0] per channel
    - Never drive RPWM and LPWM at the same time
    - enable()/disable() with de-energize-before-disable ordering

  Notes:
    - This class does NOT do closed-loop control.
    - Out-of-range speeds are clamped, never rejected.
    - While disabled, PWM outputs are held at zero regardless of commands.
===============================================================================
*/

class MotorDriver {
public:
  enum Channel : uint8_t {
    CHANNEL_A = 0,   // left
    CHANNEL_B = 1,   // right
    CHANNEL_COUNT
  };

  struct ChannelOutputs {
    PwmOutput& forward;      // RPWM
    PwmOutput& reverse;      // LPWM
    DigitalOutput& enable_a; // R_EN
    DigitalOutput& enable_b; // L_EN
  };

  /*
    invert_a / invert_b:
      If true, flips sign of commanded speed for that channel
      (mirrored motor mounting on the two sides)
  */
  MotorDriver(const ChannelOutputs& a,
              const ChannelOutputs& b,
              bool invert_a = false,
              bool invert_b = false);

  // Force safe stopped state (all PWM zero, bridges disabled).
  void begin();

  /*
    Set normalized speed command.

    speed:
      -1.0 = full reverse
       0.0 = stop (both PWM low)
      +1.0 = full forward
  */
  void setChannelSpeed(Channel ch, float speed);

  // Assert both enables on both channels.
  void enable();

  // Zero all PWM first, then drop the enables.
  void disable();

  bool isEnabled() const;

  // Debug/introspection: last applied speed (after clamp and inversion undo)
  float speedCmd(Channel ch) const;

  // Latched when any PWM write reports failure.
  bool outputFault() const;
  void clearFault();

private:
  struct ChannelState {
    float speed_cmd = 0.0f;
    bool invert = false;
  };

  static float clampSpeed_(float s);
  void applyLocked_(Channel ch, float speed);
  void writePwm_(PwmOutput& out, float duty);

  ChannelOutputs _ch_a;
  ChannelOutputs _ch_b;
  ChannelState _state[CHANNEL_COUNT];

  bool _enabled = false;
  bool _output_fault = false;

  mutable std::mutex _io_mutex;
};
