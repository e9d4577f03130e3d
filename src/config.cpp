#include "tchat/config.hpp"

#include <cerrno>
#include <cstdlib>

#include <limits>
#include <string_view>

namespace tchat {

namespace {

bool parse_uint(std::string_view text, uint64_t max, uint64_t& out) {
  if (text.empty() || text.front() == '-' || text.front() == '+') {
    return false;
  }
  std::string buf(text);
  char* end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(buf.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0' || v > max) {
    return false;
  }
  out = v;
  return true;
}

// Walks argv, handing out option values
class ArgCursor {
 public:
  ArgCursor(int argc, const char* const* argv) : argc_(argc), argv_(argv) {}

  bool done() const { return index_ >= argc_; }
  std::string_view next() { return argv_[index_++]; }

  bool value(std::string_view option, std::string_view& out, std::string& error) {
    if (index_ >= argc_) {
      error = "missing value for " + std::string(option);
      return false;
    }
    out = argv_[index_++];
    return true;
  }

 private:
  int argc_;
  const char* const* argv_;
  int index_ = 1;
};

template <typename T>
bool numeric_option(ArgCursor& args, std::string_view option, uint64_t min, uint64_t max, T& out,
                    std::string& error) {
  std::string_view text;
  if (!args.value(option, text, error)) {
    return false;
  }
  uint64_t v = 0;
  if (!parse_uint(text, max, v) || v < min) {
    error = "invalid value for " + std::string(option) + ": '" + std::string(text) + "'";
    return false;
  }
  out = static_cast<T>(v);
  return true;
}

bool log_level_option(ArgCursor& args, std::string_view option, Logger::Level& out, std::string& error) {
  std::string_view text;
  if (!args.value(option, text, error)) {
    return false;
  }
  if (!parse_log_level(text, out)) {
    error = "unknown log level '" + std::string(text) + "'";
    return false;
  }
  return true;
}

template <typename Config>
expected<Config, ErrorCode> fail(std::string* error, const std::string& reason) {
  if (error != nullptr) {
    *error = reason;
  }
  return expected<Config, ErrorCode>::error(ErrorCode::kInvalidArgument);
}

}  // namespace

expected<ServerConfig, ErrorCode> parse_server_args(int argc, const char* const* argv, std::string* error) {
  ServerConfig config;
  ArgCursor args(argc, argv);
  std::string reason;

  while (!args.done()) {
    std::string_view arg = args.next();
    bool ok = true;
    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
    } else if (arg == "--host") {
      std::string_view host;
      ok = args.value(arg, host, reason);
      config.host = std::string(host);
    } else if (arg == "-p" || arg == "--port") {
      ok = numeric_option(args, arg, 0, std::numeric_limits<uint16_t>::max(), config.port, reason);
    } else if (arg == "-m" || arg == "--max-pending") {
      ok = numeric_option(args, arg, 1, static_cast<uint64_t>(std::numeric_limits<int>::max()), config.max_pending,
                          reason);
    } else if (arg == "--max-connections") {
      ok = numeric_option(args, arg, 1, 1000000, config.max_connections, reason);
    } else if (arg == "--max-frame-bytes") {
      ok = numeric_option(args, arg, 0, std::numeric_limits<uint32_t>::max(), config.max_frame_bytes, reason);
    } else if (arg == "--send-timeout-ms") {
      ok = numeric_option(args, arg, 0, static_cast<uint64_t>(std::numeric_limits<int>::max()),
                          config.send_timeout_ms, reason);
    } else if (arg == "--log-level") {
      ok = log_level_option(args, arg, config.log_level, reason);
    } else if (arg == "--tcp-nodelay") {
      config.tcp_tuning.tcp_nodelay = true;
    } else if (arg == "--keepalive") {
      config.tcp_tuning.so_keepalive = true;
    } else {
      reason = "unknown argument '" + std::string(arg) + "'";
      ok = false;
    }
    if (!ok) {
      return fail<ServerConfig>(error, reason);
    }
  }

  if (config.host.empty() && !config.show_help) {
    return fail<ServerConfig>(error, "empty --host");
  }
  return expected<ServerConfig, ErrorCode>::success(std::move(config));
}

expected<ClientConfig, ErrorCode> parse_client_args(int argc, const char* const* argv, std::string* error) {
  ClientConfig config;
  ArgCursor args(argc, argv);
  std::string reason;

  while (!args.done()) {
    std::string_view arg = args.next();
    bool ok = true;
    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
    } else if (arg == "-p" || arg == "--port") {
      ok = numeric_option(args, arg, 1, std::numeric_limits<uint16_t>::max(), config.port, reason);
    } else if (arg == "-u" || arg == "--username") {
      std::string_view name;
      ok = args.value(arg, name, reason);
      config.username = std::string(name);
    } else if (arg == "--download-dir") {
      std::string_view dir;
      ok = args.value(arg, dir, reason);
      config.download_dir = std::string(dir);
    } else if (arg == "--max-frame-bytes") {
      ok = numeric_option(args, arg, 0, std::numeric_limits<uint32_t>::max(), config.max_frame_bytes, reason);
    } else if (arg == "--log-level") {
      ok = log_level_option(args, arg, config.log_level, reason);
    } else if (!arg.empty() && arg.front() == '-') {
      reason = "unknown argument '" + std::string(arg) + "'";
      ok = false;
    } else if (config.host.empty()) {
      config.host = std::string(arg);
    } else {
      reason = "unexpected argument '" + std::string(arg) + "'";
      ok = false;
    }
    if (!ok) {
      return fail<ClientConfig>(error, reason);
    }
  }

  if (config.show_help) {
    return expected<ClientConfig, ErrorCode>::success(std::move(config));
  }
  if (config.host.empty()) {
    return fail<ClientConfig>(error, "missing server host");
  }
  if (config.username.empty()) {
    return fail<ClientConfig>(error, "missing required --username");
  }
  if (config.username.find(kFieldSeparator) != std::string::npos) {
    return fail<ClientConfig>(error, "username may not contain '::'");
  }
  return expected<ClientConfig, ErrorCode>::success(std::move(config));
}

std::string server_usage(const char* program) {
  return std::string("Usage: ") + program +
         " [options]\n"
         "  --host ADDR              Address to bind (default: 0.0.0.0)\n"
         "  -p, --port N             Port to listen on (default: 12000)\n"
         "  -m, --max-pending N      Listen backlog (default: 10)\n"
         "  --max-connections N      Concurrent sessions before new ones are refused (default: 64)\n"
         "  --max-frame-bytes N      Largest accepted frame body, 0 = unlimited (default: 16777216)\n"
         "  --send-timeout-ms N      Per-send timeout, 0 = none (default: 0)\n"
         "  --tcp-nodelay            Disable Nagle on client sockets\n"
         "  --keepalive              Enable TCP keepalive on client sockets\n"
         "  --log-level LEVEL        debug|info|warn|error|off (default: info)\n"
         "  -h, --help               Show this help\n";
}

std::string client_usage(const char* program) {
  return std::string("Usage: ") + program +
         " HOST -u NAME [options]\n"
         "  -p, --port N             Server port (default: 12000)\n"
         "  -u, --username NAME      Chat username (required)\n"
         "  --download-dir DIR       Where received files are saved (default: received_files)\n"
         "  --max-frame-bytes N      Largest accepted frame body, 0 = unlimited (default: 16777216)\n"
         "  --log-level LEVEL        debug|info|warn|error|off (default: info)\n"
         "  -h, --help               Show this help\n";
}

}  // namespace tchat
