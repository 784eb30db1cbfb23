#include "control/AutoController.h"

#include "utils/Log.h"

static const char* TAG = "auto";

AutoController::AutoController(DriveState& state,
                               DriveController& drive,
                               RangeScanner& scanner,
                               Clock& clock)
: AutoController(state, drive, scanner, clock, Config())
{
}

AutoController::AutoController(DriveState& state,
                               DriveController& drive,
                               RangeScanner& scanner,
                               Clock& clock,
                               const Config& cfg)
: _state(state),
  _drive(drive),
  _scanner(scanner),
  _clock(clock),
  _cfg(cfg),
  _mode((uint8_t)Mode::STOPPED),
  _last_result((uint8_t)TickResult::OK),
  _ticks(0),
  _faults(0)
{
}

AutoController::~AutoController() {
  stop();
}

AutoController::StartResult AutoController::start() {
  std::lock_guard<std::mutex> lock(_lifecycle_mutex);

  if (_state.auto_mode_enabled.load()) {
    return StartResult::ALREADY_RUNNING;
  }

  // A worker released by shutdown() may still be on its way out
  if (_worker.joinable()) {
    _worker.join();
  }

  _state.auto_mode_enabled.store(true);
  _worker = std::thread(&AutoController::run_, this);

  logger::log(LogLevel::INFO, TAG, "started (threshold=%.1fcm speed=%.2f)",
              _cfg.obstacle_threshold_cm, _state.speed());
  return StartResult::STARTED;
}

AutoController::StopResult AutoController::stop() {
  std::lock_guard<std::mutex> lock(_lifecycle_mutex);

  if (!_state.auto_mode_enabled.load()) {
    if (_worker.joinable()) {
      _worker.join();
    }
    return StopResult::NOT_ACTIVE;
  }

  _state.auto_mode_enabled.store(false);
  if (_worker.joinable()) {
    _worker.join();
  }

  logger::log(LogLevel::INFO, TAG, "stopped after %lu ticks (%lu faults)",
              (unsigned long)_ticks.load(), (unsigned long)_faults.load());
  return StopResult::STOPPED;
}

void AutoController::shutdown() {
  // Not _lifecycle_mutex: stop() holds it across the join
  std::lock_guard<std::mutex> lock(_arm_mutex);
  _state.auto_mode_enabled.store(false);
  _drive.disable();
  logger::log(LogLevel::WARN, TAG, "shutdown: motors disabled");
}

bool AutoController::isRunning() const {
  return _state.auto_mode_enabled.load();
}

void AutoController::run_() {
  // A shutdown() that lands before this point leaves the driver disabled
  {
    std::lock_guard<std::mutex> lock(_arm_mutex);
    if (_state.auto_mode_enabled.load()) {
      _drive.enable();
    }
  }

  while (_state.auto_mode_enabled.load()) {
    tick();
    _clock.sleepMs(_cfg.tick_period_ms);
  }

  _drive.disable();
  setMode_(Mode::STOPPED);
}

AutoController::TickResult AutoController::tick() {
  _drive.clearFault();

  TickResult r = TickResult::OK;

  setMode_(Mode::SCANNING);
  _scanner.sweepTo(_cfg.center_deg);
  const ScanReading front = _scanner.readDistanceCm();

  if (!front.valid) {
    r = TickResult::SENSOR_FAULT;
  } else if (front.distance_cm >= _cfg.obstacle_threshold_cm) {
    _drive.forward(_state.speed());
    setMode_(Mode::CRUISING);
    r = checkOutputs_();
  } else {
    setMode_(Mode::EVADING);
    logger::log(LogLevel::INFO, TAG, "obstacle at %.1fcm", front.distance_cm);
    r = evade_(_state.speed());
    if (r == TickResult::OK) {
      setMode_(Mode::CRUISING);
    }
  }

  if (r != TickResult::OK) {
    _drive.stop();
    _faults.fetch_add(1);
    logger::log(LogLevel::WARN, TAG, "tick %lu: %s, motors stopped",
                (unsigned long)_ticks.load(), resultName(r));
  }

  _last_result.store((uint8_t)r);
  _ticks.fetch_add(1);
  return r;
}

AutoController::TickResult AutoController::evade_(float speed) {
  _drive.stop();

  _scanner.sweepTo(_cfg.scan_right_deg);
  const ScanReading right = _scanner.readDistanceCm();
  if (!right.valid) return TickResult::SENSOR_FAULT;

  _scanner.sweepTo(_cfg.scan_left_deg);
  const ScanReading left = _scanner.readDistanceCm();
  if (!left.valid) return TickResult::SENSOR_FAULT;

  _scanner.sweepTo(_cfg.center_deg);

  _drive.backward(speed);
  _clock.sleepMs(_cfg.reverse_ms);
  _drive.stop();

  const bool turn_left = (left.distance_cm > right.distance_cm);
  logger::log(LogLevel::INFO, TAG, "right=%.1fcm left=%.1fcm -> turn %s",
              right.distance_cm, left.distance_cm, turn_left ? "left" : "right");

  if (turn_left) {
    _drive.left(speed);
  } else {
    _drive.right(speed);
  }
  _clock.sleepMs(_cfg.turn_ms);
  _drive.stop();

  return checkOutputs_();
}

AutoController::TickResult AutoController::checkOutputs_() {
  return _drive.outputFault() ? TickResult::ACTUATOR_FAULT : TickResult::OK;
}

const char* AutoController::modeName(Mode m) {
  switch (m) {
    case Mode::STOPPED:  return "STOPPED";
    case Mode::SCANNING: return "SCANNING";
    case Mode::CRUISING: return "CRUISING";
    case Mode::EVADING:  return "EVADING";
  }
  return "UNKNOWN";
}

const char* AutoController::resultName(TickResult r) {
  switch (r) {
    case TickResult::OK:             return "OK";
    case TickResult::SENSOR_FAULT:   return "SENSOR_FAULT";
    case TickResult::ACTUATOR_FAULT: return "ACTUATOR_FAULT";
  }
  return "UNKNOWN";
}
