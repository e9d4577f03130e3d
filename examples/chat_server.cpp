#include "tchat.hpp"

#include <csignal>

#include <exception>
#include <iostream>
#include <string>

namespace {

tchat::Server* g_server = nullptr;

void handle_signal(int) {
  if (g_server != nullptr) {
    g_server->stop();
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string error;
  auto parsed = tchat::parse_server_args(argc, argv, &error);
  if (!parsed) {
    std::cerr << "Error: " << error << "\n" << tchat::server_usage(argv[0]);
    return 1;
  }
  const tchat::ServerConfig& config = parsed.value();
  if (config.show_help) {
    std::cout << tchat::server_usage(argv[0]);
    return 0;
  }

  tchat::Logger::set_level(config.log_level);
  std::signal(SIGPIPE, SIG_IGN);

  try {
    tchat::Server server(config);
    g_server = &server;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    server.run();
    g_server = nullptr;

    const tchat::ServerStats& stats = server.stats();
    TCHAT_LOG_INFO("Served " + std::to_string(stats.total_connections.load()) + " connections, " +
                   std::to_string(stats.total_messages_in.load()) + " messages in, " +
                   std::to_string(stats.total_messages_out.load()) + " messages out");
  } catch (const std::exception& e) {
    g_server = nullptr;
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
