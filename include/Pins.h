#pragma once
#include <Arduino.h>

/*
  Pins.h

  Purpose:
  Central location for all ESP32 pin assignments for the AutoCar robot.
  Keeps hardware mapping explicit, readable, and easy to modify.

  Board:
  ESP32 DevKit (WROOM-32)

  Notes:
  - Motor drivers are BTS7960 modules: RPWM/LPWM on LEDC outputs,
    R_EN/L_EN on plain GPIO
  - Encoder pulse channels use GPIO interrupts, phase channels are sampled
  - Input-only pins (34..39) are used for encoder and echo inputs
  - Servo uses its own LEDC channel through ESP32Servo
*/

/* ============================================================================
   BTS7960 MOTOR DRIVER PINS
   RPWM = forward PWM, LPWM = reverse PWM
   R_EN / L_EN = half-bridge enables
============================================================================ */

// Motor A (left side)
constexpr uint8_t PIN_MOTOR_A_RPWM = 25;
constexpr uint8_t PIN_MOTOR_A_LPWM = 26;
constexpr uint8_t PIN_MOTOR_A_REN  = 27;
constexpr uint8_t PIN_MOTOR_A_LEN  = 14;

// Motor B (right side)
constexpr uint8_t PIN_MOTOR_B_RPWM = 32;
constexpr uint8_t PIN_MOTOR_B_LPWM = 33;
constexpr uint8_t PIN_MOTOR_B_REN  = 18;
constexpr uint8_t PIN_MOTOR_B_LEN  = 19;

/* ============================================================================
   QUADRATURE ENCODER PINS
   Pulse = interrupt on rising edge
   Phase = level sampled at the pulse edge
============================================================================ */

// Motor A encoder
constexpr uint8_t PIN_ENC_A_PULSE = 34;
constexpr uint8_t PIN_ENC_A_PHASE = 35;

// Motor B encoder
constexpr uint8_t PIN_ENC_B_PULSE = 36;
constexpr uint8_t PIN_ENC_B_PHASE = 39;

/* ============================================================================
   ULTRASONIC DISTANCE SENSOR (HC-SR04)
============================================================================ */
// Echo is 5V on the HC-SR04; divided down to 3.3V on the carrier board.

constexpr uint8_t PIN_ULTRASONIC_TRIG = 4;
constexpr uint8_t PIN_ULTRASONIC_ECHO = 16;

/* ============================================================================
   SERVO SIGNAL PINS
============================================================================ */

constexpr uint8_t PIN_SERVO_SCAN = 13;

/* ============================================================================
   SERIAL INTERFACES
============================================================================ */

// USB Serial (host <-> ESP32)
#define SERIAL_USB Serial
