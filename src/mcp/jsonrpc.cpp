#include "mcp/jsonrpc.hpp"

#include <cctype>
#include <utility>

namespace vexdoc::mcp {

namespace {

constexpr std::size_t kMaxSanitizedLength = 256;

// Quoting and bracketing around a path, as in std::filesystem_error::what().
constexpr std::string_view kLeadingWrappers = "[(\"'<{`";
constexpr std::string_view kTrailingWrappers = "])\"'>}`,;:.";

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number();
}

void validate_id(const nlohmann::json& id) {
  if (is_valid_id(id)) {
    return;
  }
  throw JsonRpcException(
      JsonRpcError{.code = error_code::kInvalidRequest, .message = "JSON-RPC id must be string, number, or null"});
}

JsonRpcException invalid_request(std::string detail) {
  return JsonRpcException(
      JsonRpcError{.code = error_code::kInvalidRequest, .message = "Invalid Request", .data = std::move(detail)});
}

bool looks_like_path(std::string_view token) {
  if (token.empty()) {
    return false;
  }
  const bool has_separator = token.find('/') != std::string_view::npos || token.find('\\') != std::string_view::npos;
  if (!has_separator) {
    return false;
  }
  if (token.front() == '/' || token.front() == '.' || token.front() == '~' || token.front() == '\\') {
    return true;
  }
  return token.size() > 2 && std::isalpha(static_cast<unsigned char>(token[0])) != 0 && token[1] == ':';
}

}  // namespace

JsonRpcException::JsonRpcException(JsonRpcError error) : std::runtime_error(error.message), error_(std::move(error)) {}

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw invalid_request("request must be a JSON object");
  }

  const auto jsonrpc_it = request.find("jsonrpc");
  if (jsonrpc_it == request.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw invalid_request("jsonrpc must be \"2.0\"");
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw invalid_request("method must be a string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  const auto params_it = request.find("params");
  if (params_it != request.end() && !params_it->is_null()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      throw invalid_request("params must be an object or an array");
    }
    parsed.params = *params_it;
  }

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    validate_id(*id_it);
    parsed.id = *id_it;
  }

  return parsed;
}

nlohmann::json recover_id(const nlohmann::json& request) {
  if (!request.is_object()) {
    return nullptr;
  }
  const auto id_it = request.find("id");
  if (id_it == request.end() || !is_valid_id(*id_it)) {
    return nullptr;
  }
  return *id_it;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  nlohmann::json body{{"code", error.code}, {"message", error.message}};
  if (!error.data.is_null()) {
    body["data"] = error.data;
  }
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", std::move(body)}};
}

std::string sanitize_error_message(std::string_view message) {
  const auto line_end = message.find_first_of("\r\n");
  if (line_end != std::string_view::npos) {
    message = message.substr(0, line_end);
  }

  std::string sanitized;
  sanitized.reserve(message.size());
  std::size_t pos = 0;
  while (pos < message.size()) {
    if (std::isspace(static_cast<unsigned char>(message[pos])) != 0) {
      sanitized.push_back(message[pos]);
      ++pos;
      continue;
    }

    std::size_t end = pos;
    while (end < message.size() && std::isspace(static_cast<unsigned char>(message[end])) == 0) {
      ++end;
    }
    const auto token = message.substr(pos, end - pos);
    const auto core_begin = token.find_first_not_of(kLeadingWrappers);
    const auto core_end = token.find_last_not_of(kTrailingWrappers);
    if (core_begin != std::string_view::npos && core_end != std::string_view::npos && core_begin <= core_end &&
        looks_like_path(token.substr(core_begin, core_end - core_begin + 1))) {
      sanitized.append(token.substr(0, core_begin));
      sanitized += "<path>";
      sanitized.append(token.substr(core_end + 1));
    } else {
      sanitized.append(token);
    }
    pos = end;
  }

  if (sanitized.size() > kMaxSanitizedLength) {
    sanitized.resize(kMaxSanitizedLength);
  }
  return sanitized;
}

}  // namespace vexdoc::mcp
