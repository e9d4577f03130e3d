#ifndef TCHAT_CONFIG_HPP_
#define TCHAT_CONFIG_HPP_

#include "log.hpp"
#include "protocol.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>

namespace tchat {

constexpr uint16_t kDefaultPort = 12000;

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = false;   // Disable Nagle algorithm
  bool so_keepalive = false;  // Detect half-open peers

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;      // Seconds before first keepalive probe
  int keepalive_interval_s = 10;  // Seconds between probes
  int keepalive_count = 5;        // Max probes before dropping connection
};

// ============================================================================
// Server / client configuration
// ============================================================================

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = kDefaultPort;
  int max_pending = 10;  // listen() backlog
  size_t max_connections = 64;
  uint32_t max_frame_bytes = kDefaultMaxFrameBytes;
  int send_timeout_ms = 0;  // 0 = block indefinitely
  Logger::Level log_level = Logger::Level::kInfo;
  TcpTuning tcp_tuning;
  bool show_help = false;
};

struct ClientConfig {
  std::string host;
  uint16_t port = kDefaultPort;
  std::string username;
  std::string download_dir = "received_files";
  uint32_t max_frame_bytes = kDefaultMaxFrameBytes;
  Logger::Level log_level = Logger::Level::kInfo;
  bool show_help = false;
};

// Parse command-line arguments. On failure returns error(kInvalidArgument)
// and, if `error` is non-null, a human-readable reason.
expected<ServerConfig, ErrorCode> parse_server_args(int argc, const char* const* argv, std::string* error = nullptr);
expected<ClientConfig, ErrorCode> parse_client_args(int argc, const char* const* argv, std::string* error = nullptr);

std::string server_usage(const char* program);
std::string client_usage(const char* program);

}  // namespace tchat

#endif  // TCHAT_CONFIG_HPP_
