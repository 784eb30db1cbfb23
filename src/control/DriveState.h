#pragma once
#include <atomic>

#include "Params.h"

/*
  DriveState

  Shared drive settings, owned by the firmware entry point and passed by
  reference to DriveController, AutoController and CommandRouter.

  - current_speed     : open-loop duty used by every movement command.
                        Written by speed commands (compare-exchange),
                        read by manual commands and the autonomous worker.
  - auto_mode_enabled : sole run/stop flag between CommandRouter and the
                        autonomous worker. Set by AutoController::start(),
                        cleared by stop()/shutdown(), polled by the worker
                        at the top of every tick.
*/

struct DriveState {
  std::atomic<float> current_speed;
  std::atomic<bool> auto_mode_enabled;

  explicit DriveState(float initial_speed = DEFAULT_DRIVE_SPEED)
  : current_speed(initial_speed),
    auto_mode_enabled(false)
  {
  }

  DriveState(const DriveState&) = delete;
  DriveState& operator=(const DriveState&) = delete;

  float speed() const { return current_speed.load(); }
  bool autoEnabled() const { return auto_mode_enabled.load(); }
};
