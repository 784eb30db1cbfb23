#include "comms/CommandRouter.h"

#include <math.h>
#include <stdio.h>
#include <string.h>

#include "utils/Log.h"

/*
===============================================================================
  CommandRouter.cpp
===============================================================================

  Notes:
  - Routing never throws; every outcome is a CommandStatus.
  - Unknown tokens and refused tokens are logged at WARN.
  - The manual-motion path and auto_start share _mode_mutex. auto_stop
    does not take it: it joins the worker, and clearing the flag cannot
    let a manual command through.
===============================================================================
*/

static const char* TAG = "router";

uint16_t statusCode(CommandStatus s) {
  switch (s) {
    case CommandStatus::OK:              return 200;
    case CommandStatus::CONFLICT:        return 409;
    case CommandStatus::UNKNOWN_COMMAND: return 400;
  }
  return 500;
}

const char* statusName(CommandStatus s) {
  switch (s) {
    case CommandStatus::OK:              return "OK";
    case CommandStatus::CONFLICT:        return "CONFLICT";
    case CommandStatus::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
  }
  return "UNKNOWN";
}

static CommandResult makeResult(CommandStatus status, const char* fmt, const char* arg = nullptr) {
  CommandResult r;
  r.status = status;
  snprintf(r.message, sizeof(r.message), fmt, arg);
  return r;
}


/*=============================================================================
  TOKEN TABLE
=============================================================================*/

CommandRouter::Token CommandRouter::parseToken_(const char* token) {
  if (!token) return Token::UNKNOWN;

  struct Entry { const char* text; Token token; };
  static const Entry TABLE[] = {
    { "forward_start",  Token::FORWARD_START  },
    { "backward_start", Token::BACKWARD_START },
    { "left_start",     Token::LEFT_START     },
    { "right_start",    Token::RIGHT_START    },
    { "forward_stop",   Token::FORWARD_STOP   },
    { "backward_stop",  Token::BACKWARD_STOP  },
    { "left_stop",      Token::LEFT_STOP      },
    { "right_stop",     Token::RIGHT_STOP     },
    { "speed+",         Token::SPEED_UP       },
    { "speed-",         Token::SPEED_DOWN     },
    { "auto_start",     Token::AUTO_START     },
    { "auto_stop",      Token::AUTO_STOP      },
  };

  for (const Entry& e : TABLE) {
    if (strcmp(token, e.text) == 0) return e.token;
  }
  return Token::UNKNOWN;
}

bool CommandRouter::isManualMotion_(Token t) {
  switch (t) {
    case Token::FORWARD_START:
    case Token::BACKWARD_START:
    case Token::LEFT_START:
    case Token::RIGHT_START:
    case Token::FORWARD_STOP:
    case Token::BACKWARD_STOP:
    case Token::LEFT_STOP:
    case Token::RIGHT_STOP:
      return true;
    default:
      return false;
  }
}


/*=============================================================================
  ROUTING
=============================================================================*/

CommandRouter::CommandRouter(DriveState& state,
                             DriveController& drive,
                             AutoController& autopilot,
                             RangeScanner& scanner,
                             EncoderSensor& left_encoder,
                             EncoderSensor& right_encoder)
: _state(state),
  _drive(drive),
  _auto(autopilot),
  _scanner(scanner),
  _enc_left(left_encoder),
  _enc_right(right_encoder),
  _routed(0),
  _rejected(0)
{
}

void CommandRouter::manualMotion_(Token t) {
  const float speed = _state.speed();

  switch (t) {
    case Token::FORWARD_START:  _drive.forward(speed);  break;
    case Token::BACKWARD_START: _drive.backward(speed); break;
    case Token::LEFT_START:     _drive.left(speed);     break;
    case Token::RIGHT_START:    _drive.right(speed);    break;
    default:                    _drive.stop();          break;
  }
}

CommandResult CommandRouter::route(const char* token) {
  _routed.fetch_add(1);

  const Token t = parseToken_(token);

  if (t == Token::UNKNOWN) {
    _rejected.fetch_add(1);
    logger::log(LogLevel::WARN, TAG, "unknown command '%s'", token ? token : "");
    return makeResult(CommandStatus::UNKNOWN_COMMAND, "Unknown command");
  }

  if (isManualMotion_(t)) {
    // auto_start cannot slip in between the check and the motion
    std::lock_guard<std::mutex> lock(_mode_mutex);
    if (_state.autoEnabled()) {
      _rejected.fetch_add(1);
      logger::log(LogLevel::WARN, TAG, "%s refused: auto mode active", token);
      return makeResult(CommandStatus::CONFLICT, "Auto mode active");
    }

    // A fresh start token re-arms the bridge after auto_stop / shutdown
    const bool starts = (t == Token::FORWARD_START || t == Token::BACKWARD_START ||
                         t == Token::LEFT_START || t == Token::RIGHT_START);
    if (starts && !_drive.isEnabled()) {
      _drive.enable();
    }

    manualMotion_(t);
    return makeResult(CommandStatus::OK, "%s executed", token);
  }

  switch (t) {
    case Token::SPEED_UP: {
      const float s = _drive.increaseSpeed();
      logger::log(LogLevel::DEBUG, TAG, "speed -> %.1f", s);
      return makeResult(CommandStatus::OK, "%s executed", token);
    }

    case Token::SPEED_DOWN: {
      const float s = _drive.decreaseSpeed();
      logger::log(LogLevel::DEBUG, TAG, "speed -> %.1f", s);
      return makeResult(CommandStatus::OK, "%s executed", token);
    }

    case Token::AUTO_START: {
      std::lock_guard<std::mutex> lock(_mode_mutex);
      if (_auto.start() == AutoController::StartResult::ALREADY_RUNNING) {
        return makeResult(CommandStatus::CONFLICT, "Auto mode already running");
      }
      return makeResult(CommandStatus::OK, "Auto mode started");
    }

    case Token::AUTO_STOP:
      if (_auto.stop() == AutoController::StopResult::NOT_ACTIVE) {
        return makeResult(CommandStatus::CONFLICT, "Auto mode not active");
      }
      return makeResult(CommandStatus::OK, "Auto mode stopped");

    default:
      break;
  }

  // Every parsed token is handled above
  _rejected.fetch_add(1);
  return makeResult(CommandStatus::UNKNOWN_COMMAND, "Unknown command");
}


/*=============================================================================
  QUERIES
=============================================================================*/

DistanceQuery CommandRouter::queryDistance() {
  DistanceQuery q;

  const ScanReading r = _scanner.readDistanceCm();
  q.valid = r.valid;
  if (r.valid) {
    q.distance_cm = roundf(r.distance_cm * 100.0f) / 100.0f;
  }
  return q;
}

OdometryQuery CommandRouter::queryOdometry() const {
  OdometryQuery q;
  q.left_ticks = _enc_left.getCount();
  q.right_ticks = _enc_right.getCount();
  q.left_cm = _enc_left.distanceCm();
  q.right_cm = _enc_right.distanceCm();
  return q;
}

StatusQuery CommandRouter::queryStatus() const {
  StatusQuery q;
  q.auto_enabled = _state.autoEnabled();
  q.auto_mode = _auto.mode();
  q.motion = _drive.motion();
  q.drive_enabled = _drive.isEnabled();
  q.speed = _state.speed();
  q.scan_angle_deg = _scanner.currentAngle();
  q.auto_faults = _auto.faultCount();
  return q;
}
