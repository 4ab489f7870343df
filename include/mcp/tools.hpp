#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace vexdoc::mcp {

struct ToolContent {
  std::string type{"text"};
  std::string text;
};

// isError marks a failed tool run that is still a successful RPC call.
struct ToolResult {
  std::vector<ToolContent> content;
  bool is_error{false};

  static ToolResult text(std::string text);
  static ToolResult error(std::string message);
};

void to_json(nlohmann::json& out, const ToolContent& content);
void to_json(nlohmann::json& out, const ToolResult& result);

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<ToolResult(const nlohmann::json&)> handler;
};

nlohmann::json describe(const Tool& tool);

class DuplicateToolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Name-unique tool catalog. Listing preserves registration order.
class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  // Throws DuplicateToolError when the name is taken and std::invalid_argument
  // for a tool without name or handler.
  void add(Tool tool);

  [[nodiscard]] std::optional<Tool> find(const std::string& name) const;
  [[nodiscard]] std::vector<Tool> list() const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::vector<Tool> tools_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace vexdoc::mcp
