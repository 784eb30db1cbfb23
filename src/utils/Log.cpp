#include "utils/Log.h"

#include <stdio.h>
#include <atomic>
#include <mutex>

#include "Params.h"

namespace {

std::mutex g_sink_mutex;
LogSink* g_sink = nullptr;
std::atomic<uint8_t> g_level((uint8_t)LogLevel::INFO);

}  // namespace

namespace logger {

void setSink(LogSink* sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = sink;
}

void setLevel(LogLevel level) {
  g_level.store((uint8_t)level);
}

LogLevel level() {
  return (LogLevel)g_level.load();
}

void log(LogLevel level, const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level, tag, fmt, args);
  va_end(args);
}

void vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
  if ((uint8_t)level < g_level.load()) return;

  char buf[LOG_LINE_BYTES];
  vsnprintf(buf, sizeof(buf), fmt, args);

  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (!g_sink) return;
  g_sink->write(level, tag ? tag : "", buf);
}

const char* levelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "D";
    case LogLevel::INFO:  return "I";
    case LogLevel::WARN:  return "W";
    case LogLevel::ERROR: return "E";
  }
  return "?";
}

}  // namespace logger
