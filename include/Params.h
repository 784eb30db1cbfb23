#pragma once
#include <stdint.h>
#include <stddef.h>

/*
  Params.h

  Purpose:
  Central location for robot constants and tunable parameters.
  Uses metric units (centimeters, milliseconds, degrees).

  Board:
  ESP32 (Arduino framework). Everything here is plain C++ so the control
  core can also be built and unit tested on a host machine.

  Convention:
  - Distances: centimeters (cm)
  - Times: milliseconds (ms) unless suffixed _US
  - Speeds: normalized duty in [0.0, 1.0]
  - Angles: degrees, 0 = straight ahead, positive = right
*/

/* ============================================================================
   ROBOT GEOMETRY
============================================================================ */

// Drive wheels (measured)
constexpr float WHEEL_CIRCUMFERENCE_CM = 20.42f;

/* ============================================================================
   ENCODER PARAMETERS
============================================================================ */

// Pulse channel rising edges per wheel revolution
constexpr float ENCODER_PULSES_PER_REV = 500.0f;

// Edges closer than this to the last accepted edge are treated as bounce.
// Must stay below the pulse interval at top shaft speed.
constexpr uint32_t ENCODER_DEBOUNCE_US = 5000UL;

// Queue depth between the pulse ISR and the encoder task
constexpr size_t ENCODER_QUEUE_LEN = 32;

/* ============================================================================
   MOTOR LIMITS
============================================================================ */

// LEDC PWM setup for the BTS7960 RPWM/LPWM inputs
constexpr uint32_t MOTOR_PWM_FREQ_HZ = 20000UL;
constexpr uint8_t MOTOR_PWM_RESOLUTION_BITS = 8;

// Open-loop drive speed (normalized duty)
constexpr float DEFAULT_DRIVE_SPEED = 0.3f;
constexpr float DRIVE_SPEED_STEP = 0.1f;
constexpr float DRIVE_SPEED_MIN = 0.0f;
constexpr float DRIVE_SPEED_MAX = 1.0f;

/* ============================================================================
   SCAN HEAD (servo + ultrasonic)
============================================================================ */

constexpr int SCAN_MIN_DEG = -85;
constexpr int SCAN_MAX_DEG = 85;
constexpr int SCAN_CENTER_DEG = 0;

// Stepped sweep pacing
constexpr int SCAN_STEP_DEG = 5;
constexpr uint32_t SCAN_STEP_DELAY_MS = 30;

// Servo pulse widths at SCAN_MIN_DEG / SCAN_MAX_DEG
constexpr uint16_t SCAN_SERVO_MIN_PULSE_US = 500;
constexpr uint16_t SCAN_SERVO_MAX_PULSE_US = 2500;

/* ============================================================================
   ULTRASONIC SENSOR (HC-SR04)
============================================================================ */

// Martinsos library max distance (cm) and echo timeout
constexpr uint16_t ULTRASONIC_MAX_DISTANCE_CM = 400;

// Speed of sound (for computing a reasonable timeout from desired range)
constexpr float SPEED_OF_SOUND_CMPS = 34300.0f;    // ~20 C

// Round trip to ULTRASONIC_MAX_DISTANCE_CM with a 25% margin
constexpr uint32_t ULTRASONIC_TIMEOUT_US =
    (uint32_t)(1.25f * (2.0f * ULTRASONIC_MAX_DISTANCE_CM / SPEED_OF_SOUND_CMPS) * 1000000.0f);

// Valid measurement window for the wrapper sanity checks
constexpr float ULTRASONIC_MIN_VALID_CM = 2.0f;
constexpr float ULTRASONIC_MAX_VALID_CM = (float)ULTRASONIC_MAX_DISTANCE_CM;

/* ============================================================================
   AUTONOMOUS MODE
============================================================================ */

constexpr float OBSTACLE_THRESHOLD_CM = 20.0f;

constexpr uint32_t AUTO_TICK_PERIOD_MS = 100;
constexpr uint32_t AUTO_REVERSE_MS = 500;
constexpr uint32_t AUTO_TURN_MS = 600;

// Side scan positions used during evasion
constexpr int AUTO_SCAN_RIGHT_DEG = SCAN_MAX_DEG;
constexpr int AUTO_SCAN_LEFT_DEG = SCAN_MIN_DEG;

// Worker thread stack on the ESP32 (bytes)
constexpr size_t AUTO_TASK_STACK_BYTES = 6144;

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint16_t RxCOMM_UPDATE_HZ  = 200;
constexpr uint16_t TELEMETRY_UPDATE_HZ = 10;
constexpr uint16_t ODOMETRY_UPDATE_HZ = 20;

constexpr uint32_t ENCODER_TASK_STACK_BYTES = 3072;
constexpr uint8_t ENCODER_TASK_PRIORITY = 5;

/* ============================================================================
   TELEMETRY / COMMS
============================================================================ */

constexpr uint32_t SERIAL_BAUD = 115200;
constexpr uint16_t SERIAL_LINE_BUFFER_BYTES = 256;
constexpr size_t SERIAL_JSON_DOC_BYTES = 384;

// Formatted log line limit (message part)
constexpr size_t LOG_LINE_BYTES = 160;

/* ============================================================================
   DEBUG / SAFETY FLAGS
============================================================================ */

constexpr bool ENABLE_TELEMETRY = true;
constexpr bool ENABLE_SERIAL_DEBUG = false;
