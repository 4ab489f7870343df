#include "mcp/stdio_transport.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace vexdoc::mcp {

namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// Reads one '\n'-terminated line without a trailing '\r'. At most limit + 1
// bytes are kept; the remainder of a longer line is consumed and dropped, and
// line_bytes reports the full length. False at end of stream with nothing read.
bool read_bounded_line(std::istream& in, std::size_t limit, std::string& line, std::size_t& line_bytes) {
  line.clear();
  line_bytes = 0;

  bool any = false;
  char c = 0;
  while (in.get(c)) {
    any = true;
    if (c == '\n') {
      break;
    }
    ++line_bytes;
    if (line.size() <= limit) {
      line.push_back(c);
    }
  }

  if (line_bytes == line.size() && !line.empty() && line.back() == '\r') {
    line.pop_back();
    --line_bytes;
  }
  return any;
}

}  // namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out, std::size_t max_line_bytes)
    : in_(in), out_(out), max_line_bytes_(max_line_bytes) {}

std::optional<ReadResult> StdioTransport::read() {
  std::string line;
  std::size_t line_bytes = 0;
  while (!closed_ && read_bounded_line(in_, max_line_bytes_, line, line_bytes)) {
    if (line_bytes > max_line_bytes_) {
      return ReadResult{.status = ReadStatus::oversized,
                        .message = nullptr,
                        .error = "message of " + std::to_string(line_bytes) + " bytes exceeds limit of " +
                                 std::to_string(max_line_bytes_)};
    }
    if (is_blank(line)) {
      continue;
    }

    try {
      return ReadResult{.status = ReadStatus::message, .message = nlohmann::json::parse(line), .error = {}};
    } catch (const nlohmann::json::parse_error& ex) {
      return ReadResult{.status = ReadStatus::parse_error, .message = nullptr, .error = ex.what()};
    }
  }

  return std::nullopt;
}

void StdioTransport::write(const nlohmann::json& message) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed_) {
    throw TransportError("transport is closed");
  }

  out_ << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
  out_.flush();
  if (!out_) {
    throw TransportError("failed to write response to output stream");
  }
}

void StdioTransport::close() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  closed_ = true;
}

}  // namespace vexdoc::mcp
