#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace vexdoc::core {

enum class LogLevel {
  debug = 0,
  info,
  warn,
  error,
  off,
};

LogLevel parse_log_level(const std::string& value);
const char* to_string(LogLevel level);

// Line-oriented logger. Stdout carries protocol traffic, so production code
// points this at stderr.
class Logger {
 public:
  Logger(std::ostream& out, LogLevel level, std::string tag = "vexdoc-mcp");

  void debug(std::string_view message) const { write(LogLevel::debug, message); }
  void info(std::string_view message) const { write(LogLevel::info, message); }
  void warn(std::string_view message) const { write(LogLevel::warn, message); }
  void error(std::string_view message) const { write(LogLevel::error, message); }

  [[nodiscard]] bool enabled(LogLevel level) const;
  [[nodiscard]] LogLevel level() const { return level_; }

 private:
  void write(LogLevel level, std::string_view message) const;

  std::ostream& out_;
  LogLevel level_;
  std::string tag_;
  mutable std::mutex mutex_;
};

}  // namespace vexdoc::core
