#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vexdoc::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// Position of the first '#' outside a quoted value.
std::size_t find_comment(const std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if ((c == '"' || c == '\'') && (i == 0 || line[i - 1] == ' ' || line[i - 1] == ':')) {
      quote = c;
    } else if (c == '#') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t parse_max_line_bytes(const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error("transport.max_line_bytes must be greater than 0");
  }
  if (static_cast<unsigned long long>(parsed) > kMaxLineBytesLimit) {
    throw std::runtime_error("transport.max_line_bytes must be less than or equal to 67108864");
  }
  return static_cast<std::size_t>(parsed);
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "server.name") {
    if (value.empty()) {
      throw std::runtime_error("server.name must not be empty");
    }
    config.server_name = value;
    return;
  }

  if (key == "server.version") {
    if (value.empty()) {
      throw std::runtime_error("server.version must not be empty");
    }
    config.server_version = value;
    return;
  }

  if (key == "vex.default_author") {
    if (value.empty()) {
      throw std::runtime_error("vex.default_author must not be empty");
    }
    config.default_author = value;
    return;
  }

  if (key == "log.level") {
    config.log_level = parse_log_level(value);
    return;
  }

  if (key == "transport.max_line_bytes") {
    config.max_line_bytes = parse_max_line_bytes(value);
  }
}

const char* getenv_or_null(const char* name) {
  const auto* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  ServerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = find_comment(line);
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_env_overrides(ServerConfig& config) {
  if (const auto* value = getenv_or_null("VEXDOC_MCP_SERVER_NAME"); value != nullptr) {
    config.server_name = value;
  }
  if (const auto* value = getenv_or_null("VEXDOC_MCP_DEFAULT_AUTHOR"); value != nullptr) {
    config.default_author = value;
  }
  if (const auto* value = getenv_or_null("VEXDOC_MCP_LOG_LEVEL"); value != nullptr) {
    config.log_level = parse_log_level(value);
  }
  if (const auto* value = getenv_or_null("VEXDOC_MCP_MAX_LINE_BYTES"); value != nullptr) {
    config.max_line_bytes = parse_max_line_bytes(value);
  }
}

std::string format_config_settings(const ServerConfig& config) {
  std::ostringstream output;
  output << "server_name=" << config.server_name
         << " | server_version=" << config.server_version
         << " | default_author=" << config.default_author
         << " | log_level=" << to_string(config.log_level)
         << " | max_line_bytes=" << config.max_line_bytes;
  return output.str();
}

}  // namespace vexdoc::core
