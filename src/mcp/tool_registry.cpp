#include "mcp/tools.hpp"

#include <mutex>
#include <utility>

namespace vexdoc::mcp {

ToolResult ToolResult::text(std::string text) {
  return ToolResult{.content = {ToolContent{.type = "text", .text = std::move(text)}}, .is_error = false};
}

ToolResult ToolResult::error(std::string message) {
  return ToolResult{.content = {ToolContent{.type = "text", .text = std::move(message)}}, .is_error = true};
}

void to_json(nlohmann::json& out, const ToolContent& content) {
  out = nlohmann::json{{"type", content.type}, {"text", content.text}};
}

void to_json(nlohmann::json& out, const ToolResult& result) {
  out = nlohmann::json{{"content", result.content}};
  if (result.is_error) {
    out["isError"] = true;
  }
}

nlohmann::json describe(const Tool& tool) {
  return nlohmann::json{{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}};
}

void ToolRegistry::add(Tool tool) {
  if (tool.name.empty()) {
    throw std::invalid_argument("tool name must not be empty");
  }
  if (!tool.handler) {
    throw std::invalid_argument("tool " + tool.name + " has no handler");
  }

  std::unique_lock lock(mutex_);
  if (index_.count(tool.name) > 0) {
    throw DuplicateToolError("tool " + tool.name + " already registered");
  }
  index_.emplace(tool.name, tools_.size());
  tools_.push_back(std::move(tool));
}

std::optional<Tool> ToolRegistry::find(const std::string& name) const {
  std::shared_lock lock(mutex_);
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return tools_[it->second];
}

std::vector<Tool> ToolRegistry::list() const {
  std::shared_lock lock(mutex_);
  return tools_;
}

std::size_t ToolRegistry::size() const {
  std::shared_lock lock(mutex_);
  return tools_.size();
}

}  // namespace vexdoc::mcp
