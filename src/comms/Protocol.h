#pragma once
#include <Arduino.h>

#include "comms/CommandRouter.h"
#include "comms/Messages.h"
#include "comms/RequestDecoder.h"
#include "utils/Log.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode helpers for the host <-> robot wire protocol. Request decoding
  lives in RequestDecoder.h.

  Wire format:
    - Newline-delimited JSON (one object per line)
    - Each encode* writes exactly one line including the trailing '\n'
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Robot -> Host)
=============================================================================*/

void encodeReplyLine(const ReplyFrame& r, Print& out);

void encodeDistanceLine(uint32_t seq, const DistanceQuery& q, Print& out);
void encodeOdometryLine(uint32_t seq, const OdometryQuery& q, Print& out);
void encodeStatusLine(uint32_t seq, const StatusQuery& q, Print& out);

// {"type":"error","seq":N,"code":400,"msg":"..."} for undecodable requests
void encodeErrorLine(uint32_t seq, uint16_t code, const char* msg, Print& out);

void encodeTelemetryLine(const TelemetryFrame& t, Print& out);
void encodeLogLine(uint32_t time_ms, LogLevel level, const char* tag, const char* msg, Print& out);
void encodeBootLine(uint32_t time_ms, const char* name, const char* version, Print& out);

}  // namespace protocol
