#include "mcp/server.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace vexdoc::mcp {

namespace {

JsonRpcException invalid_params(const char* message, std::string detail) {
  return JsonRpcException(
      JsonRpcError{.code = error_code::kInvalidParams, .message = message, .data = std::move(detail)});
}

JsonRpcError internal_error(std::string_view detail) {
  return JsonRpcError{
      .code = error_code::kInternalError, .message = "Internal error", .data = sanitize_error_message(detail)};
}

std::string string_field_or(const nlohmann::json& object, const char* key, const char* fallback) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

}  // namespace

Server::Server(ServerInfo info, const core::Logger& logger) : info_(std::move(info)), logger_(logger) {}

void Server::register_tool(Tool tool) {
  const auto name = tool.name;
  tools_.add(std::move(tool));
  logger_.info("registered tool: " + name);
}

int Server::run(Transport& transport, const std::function<bool()>& should_stop) {
  logger_.info("MCP server starting: " + info_.name + " v" + info_.version);
  logger_.info(std::string("protocol version: ") + kProtocolVersion);

  while (true) {
    if (should_stop && should_stop()) {
      logger_.info("shutdown requested; exiting cleanly");
      break;
    }

    const auto inbound = transport.read();
    if (!inbound.has_value()) {
      logger_.info("connection closed");
      break;
    }

    std::optional<nlohmann::json> response;
    switch (inbound->status) {
      case ReadStatus::parse_error:
        logger_.error("failed to parse request: " + inbound->error);
        response = make_error_response(
            nullptr, JsonRpcError{.code = error_code::kParseError,
                                  .message = "Parse error",
                                  .data = sanitize_error_message(inbound->error)});
        break;
      case ReadStatus::oversized:
        logger_.error("rejected request: " + inbound->error);
        response = make_error_response(
            nullptr,
            JsonRpcError{.code = error_code::kInvalidRequest, .message = "Invalid Request", .data = inbound->error});
        break;
      case ReadStatus::message:
        response = handle_message(inbound->message);
        break;
    }

    if (!response.has_value()) {
      continue;
    }

    try {
      transport.write(*response);
      if (logger_.enabled(core::LogLevel::debug)) {
        logger_.debug("sent response: id=" + response->at("id").dump() +
                      " error=" + (response->contains("error") ? "true" : "false"));
      }
    } catch (const TransportError& ex) {
      logger_.error(std::string("write error: ") + ex.what());
      transport.close();
      return 1;
    }
  }

  transport.close();
  return 0;
}

std::optional<nlohmann::json> Server::handle_message(const nlohmann::json& message) {
  JsonRpcRequest request;
  try {
    request = parse_request(message);
  } catch (const JsonRpcException& ex) {
    logger_.warn("invalid request: " + ex.error().data.dump());
    return make_error_response(recover_id(message), ex.error());
  }

  if (request.is_notification()) {
    logger_.debug("received notification: method=" + request.method);
    return std::nullopt;
  }

  const auto& id = *request.id;
  logger_.debug("received request: method=" + request.method + " id=" + id.dump());

  try {
    return make_result_response(id, dispatch(request));
  } catch (const JsonRpcException& ex) {
    logger_.warn(request.method + " failed: " + ex.error().message);
    return make_error_response(id, ex.error());
  } catch (const std::invalid_argument& ex) {
    logger_.warn(request.method + " rejected params: " + ex.what());
    return make_error_response(
        id, JsonRpcError{.code = error_code::kInvalidParams, .message = "Invalid params", .data = ex.what()});
  } catch (const std::exception& ex) {
    logger_.error("internal error while handling " + request.method + ": " + ex.what());
    return make_error_response(id, internal_error(ex.what()));
  } catch (...) {
    logger_.error("unknown exception while handling " + request.method);
    return make_error_response(id, internal_error("unexpected failure"));
  }
}

const std::unordered_map<std::string_view, Server::MethodHandler>& Server::method_table() {
  static const std::unordered_map<std::string_view, MethodHandler> table{
      {method::kInitialize, &Server::handle_initialize},
      {method::kToolsList, &Server::handle_tools_list},
      {method::kToolsCall, &Server::handle_tools_call},
  };
  return table;
}

nlohmann::json Server::dispatch(const JsonRpcRequest& request) {
  const auto& table = method_table();
  const auto it = table.find(request.method);
  if (it == table.end()) {
    throw JsonRpcException(
        JsonRpcError{.code = error_code::kMethodNotFound, .message = "Method not found: " + request.method});
  }
  return (this->*(it->second))(request.params);
}

nlohmann::json Server::handle_initialize(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw invalid_params("Invalid initialize parameters", "params must be an object");
  }

  const auto version_it = params.find("protocolVersion");
  if (version_it != params.end() && !version_it->is_null()) {
    if (!version_it->is_string()) {
      throw invalid_params("Invalid initialize parameters", "protocolVersion must be a string");
    }
    const auto& requested = version_it->get_ref<const std::string&>();
    if (requested != kProtocolVersion) {
      throw JsonRpcException(JsonRpcError{.code = error_code::kInvalidParams,
                                          .message = "Unsupported protocol version: " + requested,
                                          .data = {{"supported", nlohmann::json::array({kProtocolVersion})},
                                                   {"requested", requested}}});
    }
  }

  const auto client_it = params.find("clientInfo");
  if (client_it != params.end() && client_it->is_object()) {
    logger_.info("initialized by client: " + string_field_or(*client_it, "name", "unknown") + " v" +
                 string_field_or(*client_it, "version", "unknown"));
  } else {
    logger_.info("initialized by unidentified client");
  }
  initialized_.store(true);

  return nlohmann::json{{"protocolVersion", kProtocolVersion},
                        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}},
                        {"capabilities", {{"tools", {{"listChanged", false}}}}}};
}

nlohmann::json Server::handle_tools_list(const nlohmann::json& /*params*/) {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : tools_.list()) {
    tools.push_back(describe(tool));
  }
  logger_.info("listed " + std::to_string(tools.size()) + " tools");
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw invalid_params("Invalid tool call parameters", "params must be an object");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw invalid_params("Invalid tool call parameters", "name must be a string");
  }
  const auto& name = name_it->get_ref<const std::string&>();

  nlohmann::json arguments = nlohmann::json::object();
  const auto args_it = params.find("arguments");
  if (args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      throw invalid_params("Invalid tool call parameters", "arguments must be an object");
    }
    arguments = *args_it;
  }

  const auto tool = tools_.find(name);
  if (!tool.has_value()) {
    throw JsonRpcException(JsonRpcError{.code = error_code::kMethodNotFound, .message = "Tool not found: " + name});
  }

  logger_.info("executing tool: " + name);
  ToolResult result;
  try {
    result = tool->handler(arguments);
  } catch (const std::exception& ex) {
    logger_.error("tool " + name + " failed: " + ex.what());
    throw JsonRpcException(internal_error(ex.what()));
  }

  if (result.is_error) {
    logger_.warn("tool " + name + " reported an error: " +
                 (result.content.empty() ? std::string{} : result.content.front().text));
  }
  return nlohmann::json(result);
}

}  // namespace vexdoc::mcp
