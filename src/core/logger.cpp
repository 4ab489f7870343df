#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace vexdoc::core {

LogLevel parse_log_level(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lower),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") {
    return LogLevel::debug;
  }
  if (lower == "info") {
    return LogLevel::info;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::warn;
  }
  if (lower == "error") {
    return LogLevel::error;
  }
  if (lower == "off" || lower == "none") {
    return LogLevel::off;
  }

  throw std::runtime_error("unknown log level: " + value);
}

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug:
      return "DEBUG";
    case LogLevel::info:
      return "INFO";
    case LogLevel::warn:
      return "WARN";
    case LogLevel::error:
      return "ERROR";
    case LogLevel::off:
      return "OFF";
  }
  return "UNKNOWN";
}

Logger::Logger(std::ostream& out, LogLevel level, std::string tag)
    : out_(out), level_(level), tag_(std::move(tag)) {}

bool Logger::enabled(LogLevel level) const {
  return level_ != LogLevel::off && level >= level_;
}

void Logger::write(LogLevel level, std::string_view message) const {
  if (!enabled(level)) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << '[' << tag_ << "] " << to_string(level) << ' ' << message << '\n';
  out_.flush();
}

}  // namespace vexdoc::core
