#pragma once
#include <stdint.h>
#include <atomic>

#include "actuators/MotorDriver.h"
#include "control/DriveState.h"

/*
  DriveController.h

  Purpose:
  Differential drive primitives on top of the two MotorDriver channels.
  Used the same way by manual commands (CommandRouter) and the autonomous
  worker (AutoController).

  Responsibilities:
  - forward / backward / in-place pivot left / right / stop
  - Step DriveState::current_speed up and down on a 0.1 grid in [0, 1]
  - Forward enable/disable and fault state of the driver

  Channel mapping (A = left, B = right):
    forward  (+s, +s)
    backward (-s, -s)
    left     (-s, +s)
    right    (+s, -s)
    stop     ( 0,  0)
*/

class DriveController {
public:
  enum class Motion : uint8_t {
    STOP = 0,
    FORWARD,
    BACKWARD,
    LEFT,
    RIGHT,
  };

  DriveController(MotorDriver& motors, DriveState& state);

  void forward(float speed);
  void backward(float speed);
  void left(float speed);
  void right(float speed);
  void stop();

  // Returns the new current speed.
  float increaseSpeed();
  float decreaseSpeed();

  void enable() { _motors.enable(); }
  void disable();
  bool isEnabled() const { return _motors.isEnabled(); }

  bool outputFault() const { return _motors.outputFault(); }
  void clearFault() { _motors.clearFault(); }

  // Last primitive issued (telemetry only)
  Motion motion() const { return (Motion)_motion.load(); }
  static const char* motionName(Motion m);

  float speedCmdLeft() const { return _motors.speedCmd(MotorDriver::CHANNEL_A); }
  float speedCmdRight() const { return _motors.speedCmd(MotorDriver::CHANNEL_B); }

private:
  void apply_(Motion m, float left, float right);
  float stepSpeed_(float delta);

  MotorDriver& _motors;
  DriveState& _state;

  std::atomic<uint8_t> _motion;
};
