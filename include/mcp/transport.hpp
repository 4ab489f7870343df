#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace vexdoc::mcp {

enum class ReadStatus {
  message,
  parse_error,
  oversized,
};

struct ReadResult {
  ReadStatus status{ReadStatus::message};
  nlohmann::json message{};
  std::string error{};
};

class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Transport {
 public:
  virtual ~Transport() = default;

  // Blocks until a message is available. std::nullopt means end of stream.
  // Framing failures are reported in the result, not thrown.
  virtual std::optional<ReadResult> read() = 0;

  // Synchronous and ordered. Throws TransportError on I/O failure.
  virtual void write(const nlohmann::json& message) = 0;

  virtual void close() = 0;
};

}  // namespace vexdoc::mcp
