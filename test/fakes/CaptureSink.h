#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "utils/Log.h"

// LogSink that keeps every line for assertions.
class CaptureSink : public LogSink {
public:
  struct Line {
    LogLevel level;
    std::string tag;
    std::string msg;
  };

  void write(LogLevel level, const char* tag, const char* msg) override {
    std::lock_guard<std::mutex> lock(_m);
    _lines.push_back(Line{ level, tag, msg });
  }

  std::vector<Line> lines() const {
    std::lock_guard<std::mutex> lock(_m);
    return _lines;
  }

  bool contains(LogLevel level, const std::string& needle) const {
    std::lock_guard<std::mutex> lock(_m);
    for (const Line& l : _lines) {
      if (l.level == level && l.msg.find(needle) != std::string::npos) return true;
    }
    return false;
  }

private:
  mutable std::mutex _m;
  std::vector<Line> _lines;
};
