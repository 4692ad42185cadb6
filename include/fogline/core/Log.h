#pragma once

#include <string_view>

namespace fogline::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Parse "trace|debug|info|warn|error|off" (case-insensitive).
bool parseLogLevel(std::string_view text, LogLevel& out);

// Optional callback sink for log messages.
//
// Sinks are invoked after the message has been written to stderr.
// The timestamp and message views are only valid for the duration of the callback.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

// Sinks obey the current log level filter. Registering the same sink twice
// delivers each message twice.
void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// When false, messages only reach sinks (tests and JSON tooling keep stderr quiet).
void setLogToStderr(bool enabled);

void log(LogLevel level, std::string_view message);

} // namespace fogline::core

#define FOGLINE_LOG_TRACE(msg) ::fogline::core::log(::fogline::core::LogLevel::Trace, (msg))
#define FOGLINE_LOG_DEBUG(msg) ::fogline::core::log(::fogline::core::LogLevel::Debug, (msg))
#define FOGLINE_LOG_INFO(msg)  ::fogline::core::log(::fogline::core::LogLevel::Info,  (msg))
#define FOGLINE_LOG_WARN(msg)  ::fogline::core::log(::fogline::core::LogLevel::Warn,  (msg))
#define FOGLINE_LOG_ERROR(msg) ::fogline::core::log(::fogline::core::LogLevel::Error, (msg))
