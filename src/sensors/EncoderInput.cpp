#include "sensors/EncoderInput.h"

#include "Params.h"
#include "utils/Log.h"

EncoderInput::EncoderInput(const char* name,
                           uint8_t pin_pulse,
                           uint8_t pin_phase,
                           EncoderSensor& sensor)
: _name(name),
  _pin_pulse(pin_pulse),
  _pin_phase(pin_phase),
  _sensor(sensor)
{
}

bool EncoderInput::begin() {
  pinMode(_pin_pulse, INPUT);
  pinMode(_pin_phase, INPUT);

  _queue = xQueueCreate(ENCODER_QUEUE_LEN, sizeof(Edge));
  if (_queue == nullptr) {
    logger::log(LogLevel::ERROR, "enc", "%s: queue alloc failed", _name);
    return false;
  }

  const BaseType_t ok = xTaskCreatePinnedToCore(
      task_,
      _name,
      ENCODER_TASK_STACK_BYTES,
      this,
      ENCODER_TASK_PRIORITY,
      &_task,
      1);
  if (ok != pdPASS) {
    logger::log(LogLevel::ERROR, "enc", "%s: task create failed", _name);
    vQueueDelete(_queue);
    _queue = nullptr;
    return false;
  }

  attachInterruptArg(digitalPinToInterrupt(_pin_pulse), isr_, this, RISING);

  logger::log(LogLevel::INFO, "enc", "%s: pulse=%u phase=%u",
              _name, (unsigned)_pin_pulse, (unsigned)_pin_phase);
  return true;
}

void IRAM_ATTR EncoderInput::isr_(void* arg) {
  EncoderInput* self = static_cast<EncoderInput*>(arg);

  Edge e;
  e.t_us = micros();
  e.phase_high = (digitalRead(self->_pin_phase) == HIGH);

  BaseType_t woken = pdFALSE;
  if (xQueueSendFromISR(self->_queue, &e, &woken) != pdTRUE) {
    self->_dropped = self->_dropped + 1;
  }
  if (woken == pdTRUE) {
    portYIELD_FROM_ISR();
  }
}

void EncoderInput::task_(void* arg) {
  EncoderInput* self = static_cast<EncoderInput*>(arg);

  Edge e;
  for (;;) {
    if (xQueueReceive(self->_queue, &e, portMAX_DELAY) == pdTRUE) {
      self->_sensor.onPulseEdge(e.phase_high, e.t_us);
    }
  }
}
