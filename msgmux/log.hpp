#ifndef MSGMUX_LOG_HPP
#define MSGMUX_LOG_HPP

// Process-wide logging for msgmux, formatted with {fmt}.
//
// Messages below the current level are dropped before formatting. The
// default sink writes one line per message to stderr; SetLogSink replaces
// it (tests capture lines this way).

#include <exception>
#include <functional>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace msgmux {

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Off = 5,
};

using LogSink = std::function<void(LogLevel, const std::string&)>;

const char* LogLevelString(LogLevel level);

// Default level is Warn
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool ShouldLog(LogLevel level);

// Replace the sink. Passing nullptr restores the stderr sink.
void SetLogSink(LogSink sink);

namespace detail {
// Hand a formatted body to the current sink. Never throws.
void WriteLog(LogLevel level, std::string&& body) noexcept;
}  // namespace detail

template <typename... Args>
void Log(LogLevel level, fmt::format_string<Args...> fmt_str,
         Args&&... args) noexcept {
  if (!ShouldLog(level)) {
    return;
  }
  try {
    detail::WriteLog(level, fmt::format(fmt_str, std::forward<Args>(args)...));
  } catch (const std::exception& ex) {
    detail::WriteLog(level, std::string("[FORMAT ERROR] ") + ex.what());
  }
}

}  // namespace msgmux

#define MSGMUX_LOG_TRACE(...) ::msgmux::Log(::msgmux::LogLevel::Trace, __VA_ARGS__)
#define MSGMUX_LOG_DEBUG(...) ::msgmux::Log(::msgmux::LogLevel::Debug, __VA_ARGS__)
#define MSGMUX_LOG_INFO(...) ::msgmux::Log(::msgmux::LogLevel::Info, __VA_ARGS__)
#define MSGMUX_LOG_WARN(...) ::msgmux::Log(::msgmux::LogLevel::Warn, __VA_ARGS__)
#define MSGMUX_LOG_ERROR(...) ::msgmux::Log(::msgmux::LogLevel::Error, __VA_ARGS__)

#endif  // MSGMUX_LOG_HPP
