#pragma once
#include <math.h>
#include <stddef.h>
#include <stdint.h>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Frames exchanged with the host over newline-delimited JSON.

  Host -> Robot:
    {"type":"cmd","seq":7,"token":"forward_start"}
    {"type":"query","seq":8,"what":"distance"}
    forward_start                      (bare line, bench terminals)

  Robot -> Host:
    {"type":"reply", ...}       one per cmd
    {"type":"distance", ...}    one per query (also "odometry", "status")
    {"type":"telemetry", ...}   periodic
    {"type":"log", ...}         logger output
    {"type":"boot", ...}        once after reset

  Notes:
  - Optional numeric fields use NAN and are encoded as JSON null.
===============================================================================
*/


/*=============================================================================
  REQUESTS (Host -> Robot)
=============================================================================*/

enum class RequestType : uint8_t {
  UNKNOWN = 0,
  CMD,
  QUERY,
};

enum class QueryKind : uint8_t {
  UNKNOWN = 0,
  DISTANCE,
  ODOMETRY,
  STATUS,
};

constexpr size_t TOKEN_MAX_LEN = 32;

struct RequestFrame {
  RequestType type = RequestType::UNKNOWN;
  uint32_t seq = 0;

  char token[TOKEN_MAX_LEN] = {0};     // CMD only
  QueryKind what = QueryKind::UNKNOWN; // QUERY only

  bool bare = false;    // came in as a plain token line
  bool valid = false;   // set true after successful decode
};


/*=============================================================================
  RESPONSES (Robot -> Host)
=============================================================================*/

// {"type":"reply","seq":N,"ok":bool,"code":200,"msg":"...","speed":0.3}
struct ReplyFrame {
  uint32_t seq = 0;
  bool ok = false;
  uint16_t code = 0;
  const char* msg = nullptr;
  float speed = NAN;
};

// Periodic state snapshot
struct TelemetryFrame {
  uint32_t time_ms = 0;

  // drive
  bool drive_enabled = false;
  const char* motion = nullptr;
  float speed = NAN;
  float cmd_left = NAN;
  float cmd_right = NAN;

  // auto
  bool auto_enabled = false;
  const char* auto_mode = nullptr;
  uint32_t auto_ticks = 0;
  uint32_t auto_faults = 0;

  // wheels
  int32_t left_ticks = 0;
  int32_t right_ticks = 0;
  float left_cm = NAN;
  float right_cm = NAN;
  float left_rpm = NAN;
  float right_rpm = NAN;

  // scan head
  int scan_deg = 0;
};
