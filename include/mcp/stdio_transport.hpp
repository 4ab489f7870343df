#pragma once

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <mutex>

#include "core/config.hpp"
#include "mcp/transport.hpp"

namespace vexdoc::mcp {

// One JSON value per line in each direction. Blank lines are skipped.
class StdioTransport : public Transport {
 public:
  StdioTransport(std::istream& in, std::ostream& out, std::size_t max_line_bytes = core::kDefaultMaxLineBytes);

  StdioTransport(const StdioTransport&) = delete;
  StdioTransport& operator=(const StdioTransport&) = delete;

  std::optional<ReadResult> read() override;
  void write(const nlohmann::json& message) override;
  void close() override;

 private:
  std::istream& in_;
  std::ostream& out_;
  std::size_t max_line_bytes_;
  std::atomic<bool> closed_{false};
  std::mutex write_mutex_;
};

}  // namespace vexdoc::mcp
