#pragma once
#include <stdint.h>
#include <stdarg.h>

/*
  Log.h

  Purpose:
  Small leveled logger shared by the control core and the firmware.

  - Messages are printf-formatted into a fixed buffer (LOG_LINE_BYTES)
  - One LogSink receives every message at or above the current level
  - Sink writes are serialized (worker thread, encoder tasks and loop()
    may all log)

  With no sink installed, logging is a no-op.
*/

enum class LogLevel : uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
};

class LogSink {
public:
  virtual ~LogSink() {}

  // msg is NUL-terminated and only valid for the duration of the call.
  virtual void write(LogLevel level, const char* tag, const char* msg) = 0;
};

namespace logger {

void setSink(LogSink* sink);
void setLevel(LogLevel level);
LogLevel level();

void log(LogLevel level, const char* tag, const char* fmt, ...);
void vlog(LogLevel level, const char* tag, const char* fmt, va_list args);

// Single-letter level tag ("D", "I", "W", "E")
const char* levelName(LogLevel level);

}  // namespace logger
