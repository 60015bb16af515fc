#include "msgmux/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>

#include <fmt/chrono.h>

namespace msgmux {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};

std::mutex& SinkMutex() {
  static std::mutex mtx;
  return mtx;
}

LogSink& Sink() {
  static LogSink sink;
  return sink;
}

void StderrSink(LogLevel level, const std::string& body) {
  auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S} [msgmux] [{}] {}\n", now,
             LogLevelString(level), body);
}

}  // namespace

const char* LogLevelString(LogLevel level) {
  switch (level) {
    case LogLevel::Trace:
      return "TRACE";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      return "OFF";
    default:
      return "UNKNOWN";
  }
}

void SetLogLevel(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel GetLogLevel() { return static_cast<LogLevel>(g_level.load()); }

bool ShouldLog(LogLevel level) {
  return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

void SetLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(SinkMutex());
  Sink() = std::move(sink);
}

namespace detail {

void WriteLog(LogLevel level, std::string&& body) noexcept {
  std::lock_guard<std::mutex> lock(SinkMutex());
  try {
    if (Sink()) {
      Sink()(level, body);
    } else {
      StderrSink(level, body);
    }
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "[msgmux] log sink failed: %s\n", ex.what());
  }
}

}  // namespace detail

}  // namespace msgmux
