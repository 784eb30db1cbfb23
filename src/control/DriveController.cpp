/*
  DriveController.cpp

  Purpose:
  Implements the differential drive primitives and speed stepping.

  Notes:
  - Speed commands are open loop (no encoder feedback).
  - Speed steps snap to the DRIVE_SPEED_STEP grid so repeated +/- never
    drift off 0.0 / 1.0 through float accumulation.
*/

#include "control/DriveController.h"

#include <math.h>

DriveController::DriveController(MotorDriver& motors, DriveState& state)
: _motors(motors),
  _state(state),
  _motion((uint8_t)Motion::STOP)
{
}

void DriveController::apply_(Motion m, float left, float right) {
  _motors.setChannelSpeed(MotorDriver::CHANNEL_A, left);
  _motors.setChannelSpeed(MotorDriver::CHANNEL_B, right);
  _motion.store((uint8_t)m);
}

void DriveController::forward(float speed)  { apply_(Motion::FORWARD,  speed,  speed); }
void DriveController::backward(float speed) { apply_(Motion::BACKWARD, -speed, -speed); }
void DriveController::left(float speed)     { apply_(Motion::LEFT,     -speed,  speed); }
void DriveController::right(float speed)    { apply_(Motion::RIGHT,     speed, -speed); }
void DriveController::stop()                { apply_(Motion::STOP,      0.0f,   0.0f); }

void DriveController::disable() {
  _motors.disable();
  _motion.store((uint8_t)Motion::STOP);
}

float DriveController::stepSpeed_(float delta) {
  float cur = _state.current_speed.load();
  float next;
  do {
    next = cur + delta;
    next = roundf(next / DRIVE_SPEED_STEP) * DRIVE_SPEED_STEP;
    if (next < DRIVE_SPEED_MIN) next = DRIVE_SPEED_MIN;
    if (next > DRIVE_SPEED_MAX) next = DRIVE_SPEED_MAX;
  } while (!_state.current_speed.compare_exchange_weak(cur, next));
  return next;
}

float DriveController::increaseSpeed() {
  return stepSpeed_(DRIVE_SPEED_STEP);
}

float DriveController::decreaseSpeed() {
  return stepSpeed_(-DRIVE_SPEED_STEP);
}

const char* DriveController::motionName(Motion m) {
  switch (m) {
    case Motion::STOP:     return "STOP";
    case Motion::FORWARD:  return "FORWARD";
    case Motion::BACKWARD: return "BACKWARD";
    case Motion::LEFT:     return "LEFT";
    case Motion::RIGHT:    return "RIGHT";
  }
  return "UNKNOWN";
}
