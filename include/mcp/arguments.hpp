#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vexdoc::mcp {

// Absent and null arguments decode to empty values. A value of the wrong type
// throws std::invalid_argument naming the argument.
std::string optional_string_argument(const nlohmann::json& arguments, const char* key);
std::vector<std::string> optional_string_list(const nlohmann::json& arguments, const char* key);

}  // namespace vexdoc::mcp
