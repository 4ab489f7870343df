#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/logger.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"
#include "mcp/transport.hpp"

namespace vexdoc::mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

namespace method {
constexpr const char* kInitialize = "initialize";
constexpr const char* kToolsList = "tools/list";
constexpr const char* kToolsCall = "tools/call";
}  // namespace method

struct ServerInfo {
  std::string name{"vexdoc-mcp-server"};
  std::string version{"0.1.0"};
};

class Server {
 public:
  Server(ServerInfo info, const core::Logger& logger);

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Register tools before run(); the registry is shared with request handlers.
  void register_tool(Tool tool);
  [[nodiscard]] const ToolRegistry& tools() const { return tools_; }
  [[nodiscard]] ToolRegistry& tools() { return tools_; }

  // Serves requests until end of stream, a write failure, or should_stop()
  // returning true between messages. Returns the process exit code.
  int run(Transport& transport, const std::function<bool()>& should_stop = {});

  // Decodes and dispatches one message. Notifications yield std::nullopt.
  std::optional<nlohmann::json> handle_message(const nlohmann::json& message);

  [[nodiscard]] bool initialized() const { return initialized_.load(); }

 private:
  using MethodHandler = nlohmann::json (Server::*)(const nlohmann::json& params);

  static const std::unordered_map<std::string_view, MethodHandler>& method_table();

  nlohmann::json dispatch(const JsonRpcRequest& request);
  nlohmann::json handle_initialize(const nlohmann::json& params);
  nlohmann::json handle_tools_list(const nlohmann::json& params);
  nlohmann::json handle_tools_call(const nlohmann::json& params);

  ServerInfo info_;
  const core::Logger& logger_;
  ToolRegistry tools_;
  std::atomic<bool> initialized_{false};
};

}  // namespace vexdoc::mcp
