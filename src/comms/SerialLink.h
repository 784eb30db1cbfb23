#pragma once
#include <Arduino.h>
#include <mutex>

#include "Params.h"
#include "comms/CommandRouter.h"
#include "comms/Messages.h"
#include "utils/Log.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Robot-side serial link handler:

    - Non-blocking read from Stream
    - Accumulate bytes into a newline-delimited line buffer
    - Decode "cmd" / "query" frames (or bare tokens) and hand them to the
      CommandRouter
    - Write replies, telemetry, boot banner and log lines via Protocol

  Also the firmware LogSink: logger output becomes {"type":"log"} lines so
  it never corrupts the NDJSON stream.

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

  TX is shared by loop() and the autonomous worker (through the logger),
  so every outgoing line is written under _tx_mutex.
===============================================================================
*/

class SerialLink : public LogSink {
public:
  SerialLink(Stream& serial, CommandRouter& router);

  void begin();

  // Call frequently (e.g., 100-200 Hz). Reads any available bytes and handles
  // complete lines. Never blocks waiting for input.
  void tick(uint32_t now_ms);

  // Convenience aliases
  void RxTick(uint32_t now_ms) { tick(now_ms); }
  void TxTick(const TelemetryFrame& t) { sendTelemetry(t); }

  void sendTelemetry(const TelemetryFrame& t);
  void sendBoot(uint32_t now_ms, const char* name, const char* version);

  // LogSink
  void write(LogLevel level, const char* tag, const char* msg) override;

  // Last seq seen on a decoded request
  uint32_t lastSeq() const { return _last_seq; }

  // RX stats
  uint32_t rxLines() const { return _lines; }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _ovf; }
  uint16_t rxMaxLenSeen() const { return _max_len_seen; }

private:
  void handleLine_(uint32_t now_ms);
  void handleCommand_(const RequestFrame& req);
  void handleQuery_(const RequestFrame& req);

  Stream& _serial;
  CommandRouter& _router;

  std::mutex _tx_mutex;

  static constexpr size_t RX_BUF_SIZE = SERIAL_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  uint32_t _last_seq = 0;

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;
  uint16_t _max_len_seen = 0;
};
