#include "comms/SerialLink.h"

#include <string.h>

#include "comms/Protocol.h"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
  - Undecodable lines get an {"type":"error","code":400} line back
===============================================================================
*/

static const char* TAG = "link";

SerialLink::SerialLink(Stream& serial, CommandRouter& router)
: _serial(serial),
  _router(router)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
}

void SerialLink::begin() {
  _rx_len = 0;
  _dropping = false;
  _last_seq = 0;

  _lines = _ok = _fail = _ovf = 0;
  _max_len_seen = 0;

  memset(_rx_buf, 0, sizeof(_rx_buf));
}

void SerialLink::sendTelemetry(const TelemetryFrame& t) {
  std::lock_guard<std::mutex> lock(_tx_mutex);
  protocol::encodeTelemetryLine(t, _serial);
}

void SerialLink::sendBoot(uint32_t now_ms, const char* name, const char* version) {
  std::lock_guard<std::mutex> lock(_tx_mutex);
  protocol::encodeBootLine(now_ms, name, version, _serial);
}

void SerialLink::write(LogLevel level, const char* tag, const char* msg) {
  std::lock_guard<std::mutex> lock(_tx_mutex);
  protocol::encodeLogLine(millis(), level, tag, msg, _serial);
}

void SerialLink::tick(uint32_t now_ms) {
  while (_serial.available() > 0) {
    int c = _serial.read();
    if (c < 0) break;

    char ch = (char)c;

    if (ch == '\r') continue;

    if (_dropping) {
      // We overflowed earlier; discard until newline to resync
      if (ch == '\n') {
        _dropping = false;
        _rx_len = 0;
      }
      continue;
    }

    if (ch == '\n') {
      _rx_buf[_rx_len] = '\0';
      _lines++;

      if (_rx_len > _max_len_seen) _max_len_seen = (uint16_t)_rx_len;

      handleLine_(now_ms);

      _rx_len = 0;
      continue;
    }

    // Append to buffer if there is room (leave space for '\0')
    if (_rx_len + 1 < RX_BUF_SIZE) {
      _rx_buf[_rx_len++] = ch;
    } else {
      _ovf++;
      _dropping = true;

      _rx_buf[RX_BUF_SIZE - 1] = '\0';
      logger::log(LogLevel::WARN, TAG, "rx overflow (ovf=%lu) head=%.24s",
                  (unsigned long)_ovf, _rx_buf);

      _rx_len = 0;
    }
  }
}

void SerialLink::handleLine_(uint32_t now_ms) {
  (void)now_ms;
  if (_rx_buf[0] == '\0') return;

  RequestFrame req;
  if (!protocol::decodeRequestLine(_rx_buf, req) || !req.valid) {
    _fail++;
    logger::log(LogLevel::WARN, TAG, "rx fail (lines=%lu fail=%lu) len=%u head=%.24s",
                (unsigned long)_lines, (unsigned long)_fail,
                (unsigned)_rx_len, _rx_buf);

    std::lock_guard<std::mutex> lock(_tx_mutex);
    protocol::encodeErrorLine(req.seq, statusCode(CommandStatus::UNKNOWN_COMMAND),
                              "Malformed request", _serial);
    return;
  }

  _ok++;
  _last_seq = req.seq;

  if (req.type == RequestType::CMD) {
    handleCommand_(req);
  } else {
    handleQuery_(req);
  }
}

void SerialLink::handleCommand_(const RequestFrame& req) {
  // route() may block (auto_stop joins the worker) and may log: no TX lock here
  const CommandResult res = _router.route(req.token);

  ReplyFrame reply;
  reply.seq = req.seq;
  reply.ok = res.ok();
  reply.code = res.code();
  reply.msg = res.message;
  reply.speed = _router.currentSpeed();

  std::lock_guard<std::mutex> lock(_tx_mutex);
  protocol::encodeReplyLine(reply, _serial);
}

void SerialLink::handleQuery_(const RequestFrame& req) {
  switch (req.what) {
    case QueryKind::DISTANCE: {
      const DistanceQuery q = _router.queryDistance();
      std::lock_guard<std::mutex> lock(_tx_mutex);
      protocol::encodeDistanceLine(req.seq, q, _serial);
      break;
    }

    case QueryKind::ODOMETRY: {
      const OdometryQuery q = _router.queryOdometry();
      std::lock_guard<std::mutex> lock(_tx_mutex);
      protocol::encodeOdometryLine(req.seq, q, _serial);
      break;
    }

    case QueryKind::STATUS: {
      const StatusQuery q = _router.queryStatus();
      std::lock_guard<std::mutex> lock(_tx_mutex);
      protocol::encodeStatusLine(req.seq, q, _serial);
      break;
    }

    default: {
      std::lock_guard<std::mutex> lock(_tx_mutex);
      protocol::encodeErrorLine(req.seq, statusCode(CommandStatus::UNKNOWN_COMMAND),
                                "Unknown query", _serial);
      break;
    }
  }
}
