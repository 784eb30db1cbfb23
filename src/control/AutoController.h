#pragma once
#include <stdint.h>
#include <atomic>
#include <mutex>
#include <thread>

#include "Params.h"
#include "control/DriveController.h"
#include "control/DriveState.h"
#include "hal/HardwareInterfaces.h"
#include "sensors/RangeScanner.h"

/*
===============================================================================
  AutoController.h
===============================================================================

  PURPOSE
  -------
  Autonomous obstacle avoidance on a dedicated worker thread.

  STATE MACHINE
  -------------
    STOPPED --start()--> (enable driver)
      every tick_period_ms while DriveState::auto_mode_enabled:
        SCANNING : center head, read front distance
        CRUISING : front >= threshold -> forward(current_speed)
        EVADING  : front <  threshold ->
                   stop, scan right, scan left, recenter,
                   backward reverse_ms, stop,
                   turn toward the larger side reading turn_ms, stop
    flag cleared --> (disable driver) --> STOPPED

  FAULTS
  ------
  Each tick returns a TickResult. Anything other than OK is logged, the
  motors are stopped and the loop carries on with the next tick. The loop
  never exits on a fault.

  TIMING
  ------
  All waits are blocking sleeps on the worker. stop() is honoured at the
  top of the next tick, so a sweep or timed manoeuvre already in progress
  runs to completion first. stop() joins the worker: when it returns the
  driver is disabled.
===============================================================================
*/

class AutoController {
public:
  enum class Mode : uint8_t {
    STOPPED = 0,
    SCANNING,
    CRUISING,
    EVADING,
  };

  enum class TickResult : uint8_t {
    OK = 0,
    SENSOR_FAULT,     // distance read returned no valid sample
    ACTUATOR_FAULT,   // driver reported a failed PWM write
  };

  enum class StartResult : uint8_t { STARTED, ALREADY_RUNNING };
  enum class StopResult : uint8_t { STOPPED, NOT_ACTIVE };

  struct Config {
    float obstacle_threshold_cm = OBSTACLE_THRESHOLD_CM;

    uint32_t tick_period_ms = AUTO_TICK_PERIOD_MS;
    uint32_t reverse_ms = AUTO_REVERSE_MS;
    uint32_t turn_ms = AUTO_TURN_MS;

    int center_deg = SCAN_CENTER_DEG;
    int scan_right_deg = AUTO_SCAN_RIGHT_DEG;
    int scan_left_deg = AUTO_SCAN_LEFT_DEG;
  };

  AutoController(DriveState& state,
                 DriveController& drive,
                 RangeScanner& scanner,
                 Clock& clock);
  AutoController(DriveState& state,
                 DriveController& drive,
                 RangeScanner& scanner,
                 Clock& clock,
                 const Config& cfg);

  // Stops and joins the worker if still running.
  ~AutoController();

  AutoController(const AutoController&) = delete;
  AutoController& operator=(const AutoController&) = delete;

  StartResult start();

  // Blocks until the worker has exited and the driver is disabled.
  StopResult stop();

  /*
    Fatal-path cleanup (reset / power-down hooks).

    Clears the run flag and disables the driver immediately without
    waiting for the worker. A disabled MotorDriver holds every output at
    zero, so the worker cannot re-energize the motors on its way out.
    A worker that has not armed yet never enables the driver.
  */
  void shutdown();

  bool isRunning() const;

  /*
    One loop iteration (scan, then cruise or evade).
    Runs on the worker; also called directly by bench tests.
  */
  TickResult tick();

  Mode mode() const { return (Mode)_mode.load(); }
  TickResult lastResult() const { return (TickResult)_last_result.load(); }
  uint32_t tickCount() const { return _ticks.load(); }
  uint32_t faultCount() const { return _faults.load(); }

  const Config& config() const { return _cfg; }

  static const char* modeName(Mode m);
  static const char* resultName(TickResult r);

private:
  void run_();
  TickResult evade_(float speed);
  TickResult checkOutputs_();
  void setMode_(Mode m) { _mode.store((uint8_t)m); }

  DriveState& _state;
  DriveController& _drive;
  RangeScanner& _scanner;
  Clock& _clock;
  Config _cfg;

  // Serializes start()/stop() so only one worker can exist.
  std::mutex _lifecycle_mutex;
  std::thread _worker;

  // Orders shutdown() against the worker's initial driver enable.
  std::mutex _arm_mutex;

  std::atomic<uint8_t> _mode;
  std::atomic<uint8_t> _last_result;
  std::atomic<uint32_t> _ticks;
  std::atomic<uint32_t> _faults;
};
