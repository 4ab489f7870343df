#include "mcp/arguments.hpp"

#include <stdexcept>

namespace vexdoc::mcp {

std::string optional_string_argument(const nlohmann::json& arguments, const char* key) {
  const auto it = arguments.find(key);
  if (it == arguments.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

std::vector<std::string> optional_string_list(const nlohmann::json& arguments, const char* key) {
  std::vector<std::string> values;
  const auto it = arguments.find(key);
  if (it == arguments.end() || it->is_null()) {
    return values;
  }
  if (!it->is_array()) {
    throw std::invalid_argument(std::string(key) + " must be an array of strings");
  }
  values.reserve(it->size());
  for (const auto& item : *it) {
    if (!item.is_string()) {
      throw std::invalid_argument(std::string(key) + " must be an array of strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

}  // namespace vexdoc::mcp
