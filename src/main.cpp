#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/logger.hpp"
#include "mcp/server.hpp"
#include "mcp/stdio_transport.hpp"
#include "mcp/vex_tools.hpp"
#include "vex/client.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  vexdoc::core::ServerConfig config{};
  try {
    if (argc > 1) {
      config = vexdoc::core::load_server_config(argv[1]);
    }
    vexdoc::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  const vexdoc::core::Logger logger(std::cerr, config.log_level);
  if (argc > 1) {
    logger.info(std::string("loaded config from ") + argv[1]);
  }
  logger.info(vexdoc::core::format_config_settings(config));

  vexdoc::mcp::Server server(vexdoc::mcp::ServerInfo{.name = config.server_name, .version = config.server_version},
                             logger);
  try {
    const auto client = std::make_shared<const vexdoc::vex::Client>(config.default_author);
    vexdoc::mcp::register_vex_tools(server, client);
  } catch (const std::exception& ex) {
    logger.error(std::string("failed to register tools: ") + ex.what());
    return 1;
  }

  vexdoc::mcp::StdioTransport transport(std::cin, std::cout, config.max_line_bytes);
  return server.run(transport, [] { return g_shutdown_requested != 0; });
}
