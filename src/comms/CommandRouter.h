#pragma once
#include <stdint.h>
#include <atomic>
#include <mutex>

#include "control/AutoController.h"
#include "control/DriveController.h"
#include "control/DriveState.h"
#include "sensors/EncoderSensor.h"
#include "sensors/RangeScanner.h"

/*
===============================================================================
  CommandRouter.h
===============================================================================

  PURPOSE
  -------
  Maps command tokens (case-sensitive, whole token) onto drive and autonomous
  operations and reports a status per call. Transport independent: the
  serial link (SerialLink) feeds it tokens, tests call it directly.

  TOKENS
  ------
    forward_start backward_start left_start right_start
        enable the driver if needed, move at DriveState::current_speed
    forward_stop backward_stop left_stop right_stop
        stop both channels
    speed+ speed-
        step current_speed by 0.1 inside [0, 1]
    auto_start auto_stop
        start / stop the autonomous worker

  While auto mode runs, the eight manual motion tokens are refused with
  CONFLICT and leave the motors alone. Speed tokens stay allowed.

  STATUS CODES
  ------------
    OK              200
    UNKNOWN_COMMAND 400
    CONFLICT        409
===============================================================================
*/

enum class CommandStatus : uint8_t {
  OK = 0,
  CONFLICT,
  UNKNOWN_COMMAND,
};

// HTTP-style numeric code for transports
uint16_t statusCode(CommandStatus s);
const char* statusName(CommandStatus s);

struct CommandResult {
  CommandStatus status = CommandStatus::UNKNOWN_COMMAND;
  char message[48] = {0};

  bool ok() const { return status == CommandStatus::OK; }
  uint16_t code() const { return statusCode(status); }
};

// Front distance, rounded to 2 decimals
struct DistanceQuery {
  float distance_cm = 0.0f;
  bool valid = false;
};

struct OdometryQuery {
  int32_t left_ticks = 0;
  int32_t right_ticks = 0;
  float left_cm = 0.0f;
  float right_cm = 0.0f;
};

struct StatusQuery {
  bool auto_enabled = false;
  AutoController::Mode auto_mode = AutoController::Mode::STOPPED;
  DriveController::Motion motion = DriveController::Motion::STOP;
  bool drive_enabled = false;
  float speed = 0.0f;
  int scan_angle_deg = 0;
  uint32_t auto_faults = 0;
};

class CommandRouter {
public:
  CommandRouter(DriveState& state,
                DriveController& drive,
                AutoController& autopilot,
                RangeScanner& scanner,
                EncoderSensor& left_encoder,
                EncoderSensor& right_encoder);

  // token may be null (treated as unknown).
  CommandResult route(const char* token);

  DistanceQuery queryDistance();
  OdometryQuery queryOdometry() const;
  StatusQuery queryStatus() const;

  float currentSpeed() const { return _state.speed(); }

  uint32_t routedCount() const { return _routed.load(); }
  uint32_t rejectedCount() const { return _rejected.load(); }

private:
  enum class Token : uint8_t {
    UNKNOWN = 0,
    FORWARD_START,
    BACKWARD_START,
    LEFT_START,
    RIGHT_START,
    FORWARD_STOP,
    BACKWARD_STOP,
    LEFT_STOP,
    RIGHT_STOP,
    SPEED_UP,
    SPEED_DOWN,
    AUTO_START,
    AUTO_STOP,
  };

  static Token parseToken_(const char* token);
  static bool isManualMotion_(Token t);

  void manualMotion_(Token t);

  DriveState& _state;
  DriveController& _drive;
  AutoController& _auto;
  RangeScanner& _scanner;
  EncoderSensor& _enc_left;
  EncoderSensor& _enc_right;

  // Makes "auto off? then move" atomic with respect to auto_start
  std::mutex _mode_mutex;

  std::atomic<uint32_t> _routed;
  std::atomic<uint32_t> _rejected;
};
