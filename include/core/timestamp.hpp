#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace vexdoc::core {

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// RFC 3339 in UTC with second precision, e.g. 2024-05-01T12:30:00Z.
inline std::string format_rfc3339_utc(std::chrono::system_clock::time_point point) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(point);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, written);
}

inline std::string rfc3339_now_utc() {
  return format_rfc3339_utc(std::chrono::system_clock::now());
}

}  // namespace vexdoc::core
