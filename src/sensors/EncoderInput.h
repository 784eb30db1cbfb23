#pragma once
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>

#include "sensors/EncoderSensor.h"

/*
===============================================================================
  EncoderInput.h
===============================================================================

  PURPOSE
  -------
  Board binding that feeds one EncoderSensor from its two GPIO lines.

    pulse pin RISING ISR  ->  samples phase pin + micros()
                          ->  xQueueSendFromISR()
    encoder task          ->  xQueueReceive() -> EncoderSensor::onPulseEdge()

  The ISR never touches the tick accumulator: a mutex cannot be taken in
  interrupt context, so the lock-guarded add runs in the dedicated task
  (single producer per EncoderSensor).

  USAGE
  -----
  - Construct with pins and the sensor to feed
  - Call begin() once in setup(); returns false if the queue or task
    could not be created
===============================================================================
*/

class EncoderInput {
public:
  EncoderInput(const char* name,
               uint8_t pin_pulse,
               uint8_t pin_phase,
               EncoderSensor& sensor);

  bool begin();

  // Edges dropped because the queue was full (task starved)
  uint32_t droppedEdges() const { return _dropped; }

private:
  struct Edge {
    uint32_t t_us;
    bool phase_high;
  };

  static void isr_(void* arg);
  static void task_(void* arg);

  const char* _name;
  uint8_t _pin_pulse;
  uint8_t _pin_phase;
  EncoderSensor& _sensor;

  QueueHandle_t _queue = nullptr;
  TaskHandle_t _task = nullptr;

  volatile uint32_t _dropped = 0;
};
