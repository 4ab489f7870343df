#pragma once

#include <cstddef>
#include <string>

#include "core/logger.hpp"

namespace vexdoc::core {

constexpr std::size_t kDefaultMaxLineBytes = 1024 * 1024;
constexpr std::size_t kMaxLineBytesLimit = 64 * 1024 * 1024;

struct ServerConfig {
  std::string server_name{"vexdoc-mcp-server"};
  std::string server_version{"0.1.0"};
  std::string default_author{"vexdoc-mcp-server"};
  LogLevel log_level{LogLevel::info};
  std::size_t max_line_bytes{kDefaultMaxLineBytes};
};

ServerConfig load_server_config(const std::string& path);

// VEXDOC_MCP_SERVER_NAME, VEXDOC_MCP_DEFAULT_AUTHOR, VEXDOC_MCP_LOG_LEVEL,
// VEXDOC_MCP_MAX_LINE_BYTES take precedence over file values.
void apply_env_overrides(ServerConfig& config);

std::string format_config_settings(const ServerConfig& config);

}  // namespace vexdoc::core
