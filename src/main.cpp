/*
  AutoCar ESP32 Controller (Low Level Hardware Layer)

  Purpose:
  Wires the drive core to the board and runs the host link.

  Threads:
  - loopTask  : serial RX / command routing, odometry sampling, telemetry
  - "auto"    : AutoController worker (std::thread on a pthread)
  - "encA/B"  : one FreeRTOS task per wheel encoder (EncoderInput)

  Motors are enabled at boot so manual driving works immediately.
*/

#include <Arduino.h>
#include <esp_pthread.h>
#include <esp_system.h>

#include "Pins.h"
#include "Params.h"

#include "utils/Log.h"
#include "utils/Rate.h"
#include "hal/ArduinoHal.h"
#include "actuators/MotorDriver.h"
#include "actuators/ScanServo.h"
#include "sensors/DistanceSensor.h"
#include "sensors/EncoderInput.h"
#include "sensors/EncoderSensor.h"
#include "sensors/RangeScanner.h"
#include "control/AutoController.h"
#include "control/DriveController.h"
#include "control/DriveState.h"
#include "comms/CommandRouter.h"
#include "comms/SerialLink.h"

static const char* FIRMWARE_NAME = "autocar";
static const char* FIRMWARE_VERSION = "1.0.0";
static const char* TAG = "main";


/*=============================================================================
  GLOBALS
=============================================================================*/

// Motor bridge outputs (BTS7960)
LedcPwmOutput g_pwm_a_fwd(PIN_MOTOR_A_RPWM, MOTOR_PWM_FREQ_HZ, MOTOR_PWM_RESOLUTION_BITS);
LedcPwmOutput g_pwm_a_rev(PIN_MOTOR_A_LPWM, MOTOR_PWM_FREQ_HZ, MOTOR_PWM_RESOLUTION_BITS);
LedcPwmOutput g_pwm_b_fwd(PIN_MOTOR_B_RPWM, MOTOR_PWM_FREQ_HZ, MOTOR_PWM_RESOLUTION_BITS);
LedcPwmOutput g_pwm_b_rev(PIN_MOTOR_B_LPWM, MOTOR_PWM_FREQ_HZ, MOTOR_PWM_RESOLUTION_BITS);

GpioOutput g_en_a_r(PIN_MOTOR_A_REN);
GpioOutput g_en_a_l(PIN_MOTOR_A_LEN);
GpioOutput g_en_b_r(PIN_MOTOR_B_REN);
GpioOutput g_en_b_l(PIN_MOTOR_B_LEN);

MotorDriver g_motors(
  MotorDriver::ChannelOutputs{ g_pwm_a_fwd, g_pwm_a_rev, g_en_a_r, g_en_a_l },
  MotorDriver::ChannelOutputs{ g_pwm_b_fwd, g_pwm_b_rev, g_en_b_r, g_en_b_l }
);

// Scan head
ScanServo g_scan_servo(
  PIN_SERVO_SCAN,
  SCAN_MIN_DEG,
  SCAN_MAX_DEG,
  SCAN_SERVO_MIN_PULSE_US,
  SCAN_SERVO_MAX_PULSE_US
);

DistanceSensor g_distance_sensor(
  PIN_ULTRASONIC_TRIG,
  PIN_ULTRASONIC_ECHO,
  ULTRASONIC_MAX_DISTANCE_CM,
  ULTRASONIC_TIMEOUT_US,
  ULTRASONIC_MIN_VALID_CM,
  ULTRASONIC_MAX_VALID_CM
);

ArduinoClock g_clock;
RangeScanner g_scanner(g_scan_servo, g_distance_sensor, g_clock);

// Wheel encoders
EncoderSensor g_enc_left;
EncoderSensor g_enc_right;
EncoderInput g_enc_left_input("encA", PIN_ENC_A_PULSE, PIN_ENC_A_PHASE, g_enc_left);
EncoderInput g_enc_right_input("encB", PIN_ENC_B_PULSE, PIN_ENC_B_PHASE, g_enc_right);

// Control
DriveState g_state(DEFAULT_DRIVE_SPEED);
DriveController g_drive(g_motors, g_state);
AutoController g_auto(g_state, g_drive, g_scanner, g_clock);
CommandRouter g_router(g_state, g_drive, g_auto, g_scanner, g_enc_left, g_enc_right);

// Serial link (USB)
SerialLink g_link(SERIAL_USB, g_router);

// Rates
Rate g_comms_rate(RxCOMM_UPDATE_HZ);        // RX parsing tick (fast, non-blocking)
Rate g_odometry_rate(ODOMETRY_UPDATE_HZ);
Rate g_telemetry_rate(TELEMETRY_UPDATE_HZ);


// Runs inside esp_restart(): motors must be off before the chip resets
static void onShutdown() {
  g_auto.shutdown();
}


/*=============================================================================
  SETUP
=============================================================================*/

void setup() {
  // Serial Comms Setup
  SERIAL_USB.begin(SERIAL_BAUD);
  g_link.begin();

  logger::setSink(&g_link);
  logger::setLevel(ENABLE_SERIAL_DEBUG ? LogLevel::DEBUG : LogLevel::INFO);

  // Worker thread stack (std::thread -> pthread -> FreeRTOS task)
  esp_pthread_cfg_t cfg = esp_pthread_get_default_config();
  cfg.stack_size = AUTO_TASK_STACK_BYTES;
  cfg.thread_name = "auto";
  if (esp_pthread_set_cfg(&cfg) != ESP_OK) {
    logger::log(LogLevel::ERROR, TAG, "esp_pthread_set_cfg failed");
  }

  if (esp_register_shutdown_handler(&onShutdown) != ESP_OK) {
    logger::log(LogLevel::ERROR, TAG, "shutdown handler not registered");
  }

  // Motor bridge Setup (safe state first)
  bool pwm_ok = g_pwm_a_fwd.begin();
  pwm_ok = g_pwm_a_rev.begin() && pwm_ok;
  pwm_ok = g_pwm_b_fwd.begin() && pwm_ok;
  pwm_ok = g_pwm_b_rev.begin() && pwm_ok;
  if (!pwm_ok) {
    logger::log(LogLevel::ERROR, TAG, "LEDC attach failed");
  }

  g_en_a_r.begin();
  g_en_a_l.begin();
  g_en_b_r.begin();
  g_en_b_l.begin();
  g_motors.begin();

  // Scan head Setup
  if (!g_scan_servo.begin(SCAN_CENTER_DEG)) {
    logger::log(LogLevel::ERROR, TAG, "scan servo attach failed");
  }
  g_distance_sensor.begin();
  g_scanner.begin(SCAN_CENTER_DEG);

  // Encoder Setup
  g_enc_left_input.begin();
  g_enc_right_input.begin();

  // Manual driving ready at boot
  g_drive.enable();

  g_link.sendBoot(millis(), FIRMWARE_NAME, FIRMWARE_VERSION);
}


/*=============================================================================
  LOOP
=============================================================================*/

void loop() {

  const uint32_t now_ms = millis();

  // RX tick: read serial, route commands and answer queries
  if (g_comms_rate.ready(now_ms)) {
    g_link.RxTick(now_ms);
  }

  // Odometry tick: snapshot encoder counts for speed estimates
  if (g_odometry_rate.ready(now_ms)) {
    g_enc_left.sample(now_ms);
    g_enc_right.sample(now_ms);
  }

  // TX tick: publish telemetry
  if (ENABLE_TELEMETRY && g_telemetry_rate.ready(now_ms)) {
    TelemetryFrame t;
    t.time_ms = now_ms;

    t.drive_enabled = g_drive.isEnabled();
    t.motion = DriveController::motionName(g_drive.motion());
    t.speed = g_state.speed();
    t.cmd_left = g_drive.speedCmdLeft();
    t.cmd_right = g_drive.speedCmdRight();

    t.auto_enabled = g_state.autoEnabled();
    t.auto_mode = AutoController::modeName(g_auto.mode());
    t.auto_ticks = g_auto.tickCount();
    t.auto_faults = g_auto.faultCount();

    const EncoderSensor::State& left = g_enc_left.getState();
    const EncoderSensor::State& right = g_enc_right.getState();
    t.left_ticks = left.count;
    t.right_ticks = right.count;
    t.left_cm = left.distance_cm;
    t.right_cm = right.distance_cm;
    t.left_rpm = left.valid_speed ? left.rpm : NAN;
    t.right_rpm = right.valid_speed ? right.rpm : NAN;

    t.scan_deg = g_scanner.currentAngle();

    g_link.TxTick(t);
  }

}
