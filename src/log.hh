#pragma once

// Functions for logging human-readable messages.
//
// Usage:
//
//   LOG << "regular message";
//   ERROR << "error message";
//   FATAL << "stop the execution";
//
// Logging can also accept other types that have a `ToStr` overload - integers,
// floats & anything with a `ToStr()` method.
//
// The default logger writes to stderr. Stdout is reserved for generated
// passwords so that `genpassword | xargs ...` works.
//
// There is no need to add a new line character at the end of the logged message
// - it's added there automatically.

#include <functional>
#include <source_location>
#include <vector>

#include "status.hh"
#include "str.hh"

namespace genpw {

enum class LogLevel { Info, Error, Fatal };

// Appends the logged message when destroyed.
struct LogEntry {
  LogLevel log_level;
  std::source_location location;
  mutable std::string buffer;
  mutable int errsv;  // saved errno (if any)

  LogEntry(LogLevel, const std::source_location location = std::source_location::current());
  ~LogEntry();
};

using Logger = std::function<void(const LogEntry&)>;

void DefaultLogger(const LogEntry& e);

// Every logged entry is passed to each of these loggers in order. Starts with
// `DefaultLogger`.
extern std::vector<Logger> loggers;

#define LOG genpw::LogEntry(genpw::LogLevel::Info, std::source_location::current())

#define ERROR genpw::LogEntry(genpw::LogLevel::Error, std::source_location::current())
#define FATAL genpw::LogEntry(genpw::LogLevel::Fatal, std::source_location::current())

const LogEntry& operator<<(const LogEntry&, StrView);
const LogEntry& operator<<(const LogEntry&, const Status& status);

const LogEntry& operator<<(const LogEntry& logger, const Stringer auto& t) {
  return logger << StrView(ToStr(t));
}

}  // namespace genpw
