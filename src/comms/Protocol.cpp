#include "comms/Protocol.h"
#include <math.h>

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON protocol helpers.

  Notes:
  - Both directions use ArduinoJson with fixed-size documents
    (SERIAL_JSON_DOC_BYTES), no heap.
  - Non-finite floats are written as null.
===============================================================================
*/

#include <ArduinoJson.h>
#include <string.h>

#include "Params.h"


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

static void setFloatOrNull(JsonObject obj, const char* key, float v) {
  if (isfinite(v))
    obj[key] = v;
  else
    obj[key] = nullptr;
}

static void setStringOrNull(JsonObject obj, const char* key, const char* s) {
  if (s)
    obj[key] = s;
  else
    obj[key] = nullptr;
}

static void writeLine(const JsonDocument& doc, Print& out) {
  serializeJson(doc, out);
  out.println();
}

namespace protocol {

/*=============================================================================
  ENCODE (Robot -> Host)
=============================================================================*/

void encodeReplyLine(const ReplyFrame& r, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "reply";
  obj["seq"] = r.seq;
  obj["ok"] = r.ok;
  obj["code"] = r.code;
  setStringOrNull(obj, "msg", r.msg);
  setFloatOrNull(obj, "speed", r.speed);

  writeLine(doc, out);
}

void encodeDistanceLine(uint32_t seq, const DistanceQuery& q, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "distance";
  obj["seq"] = seq;
  obj["valid"] = q.valid;
  setFloatOrNull(obj, "distance", q.valid ? q.distance_cm : NAN);

  writeLine(doc, out);
}

void encodeOdometryLine(uint32_t seq, const OdometryQuery& q, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "odometry";
  obj["seq"] = seq;

  JsonObject left = obj.createNestedObject("left");
  left["ticks"] = q.left_ticks;
  setFloatOrNull(left, "cm", q.left_cm);

  JsonObject right = obj.createNestedObject("right");
  right["ticks"] = q.right_ticks;
  setFloatOrNull(right, "cm", q.right_cm);

  writeLine(doc, out);
}

void encodeStatusLine(uint32_t seq, const StatusQuery& q, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "status";
  obj["seq"] = seq;
  obj["auto"] = q.auto_enabled;
  obj["auto_mode"] = AutoController::modeName(q.auto_mode);
  obj["auto_faults"] = q.auto_faults;
  obj["motion"] = DriveController::motionName(q.motion);
  obj["enabled"] = q.drive_enabled;
  setFloatOrNull(obj, "speed", q.speed);
  obj["scan_deg"] = q.scan_angle_deg;

  writeLine(doc, out);
}

void encodeErrorLine(uint32_t seq, uint16_t code, const char* msg, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "error";
  obj["seq"] = seq;
  obj["code"] = code;
  setStringOrNull(obj, "msg", msg);

  writeLine(doc, out);
}

void encodeTelemetryLine(const TelemetryFrame& t, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "telemetry";
  obj["time_ms"] = t.time_ms;

  // drive
  JsonObject drive = obj.createNestedObject("drive");
  drive["enabled"] = t.drive_enabled;
  setStringOrNull(drive, "motion", t.motion);
  setFloatOrNull(drive, "speed", t.speed);
  setFloatOrNull(drive, "cmd_left", t.cmd_left);
  setFloatOrNull(drive, "cmd_right", t.cmd_right);

  // auto
  JsonObject autop = obj.createNestedObject("auto");
  autop["enabled"] = t.auto_enabled;
  setStringOrNull(autop, "mode", t.auto_mode);
  autop["ticks"] = t.auto_ticks;
  autop["faults"] = t.auto_faults;

  // wheels
  JsonObject wheel = obj.createNestedObject("wheel");
  wheel["left_ticks"] = t.left_ticks;
  wheel["right_ticks"] = t.right_ticks;
  setFloatOrNull(wheel, "left_cm", t.left_cm);
  setFloatOrNull(wheel, "right_cm", t.right_cm);
  setFloatOrNull(wheel, "left_rpm", t.left_rpm);
  setFloatOrNull(wheel, "right_rpm", t.right_rpm);

  obj["scan_deg"] = t.scan_deg;

  writeLine(doc, out);
}

void encodeLogLine(uint32_t time_ms, LogLevel level, const char* tag, const char* msg, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "log";
  obj["time_ms"] = time_ms;
  obj["level"] = logger::levelName(level);
  setStringOrNull(obj, "tag", tag);
  setStringOrNull(obj, "msg", msg);

  writeLine(doc, out);
}

void encodeBootLine(uint32_t time_ms, const char* name, const char* version, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "boot";
  obj["time_ms"] = time_ms;
  setStringOrNull(obj, "name", name);
  setStringOrNull(obj, "version", version);
  obj["msg"] = "AutoCar API Online";

  writeLine(doc, out);
}

}  // namespace protocol
