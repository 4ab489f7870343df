#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace vexdoc::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
}  // namespace error_code

struct JsonRpcError {
  int code;
  std::string message;
  nlohmann::json data{};
};

// Thrown by request handlers to answer with a specific JSON-RPC error.
class JsonRpcException : public std::runtime_error {
 public:
  explicit JsonRpcException(JsonRpcError error);

  [[nodiscard]] const JsonRpcError& error() const { return error_; }

 private:
  JsonRpcError error_;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
};

// Throws JsonRpcException with kInvalidRequest when the envelope is malformed.
JsonRpcRequest parse_request(const nlohmann::json& request);

// Best-effort id extraction from a message that failed validation; null when
// nothing usable is present.
nlohmann::json recover_id(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

// Strips path-like tokens and anything after the first line break, then caps
// the length, so internal failures never leak filesystem layout.
std::string sanitize_error_message(std::string_view message);

}  // namespace vexdoc::mcp
