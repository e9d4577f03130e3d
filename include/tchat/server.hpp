#ifndef TCHAT_SERVER_HPP_
#define TCHAT_SERVER_HPP_

#include "broadcaster.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "registry.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <functional>
#include <memory>
#include <sockpp/tcp_acceptor.h>
#include <string>
#include <thread>
#include <vector>

namespace tchat {

// ============================================================================
// Server (accept loop + one blocking session thread per connection)
// ============================================================================

class Server {
 public:
  // Binds and listens immediately; throws std::runtime_error on failure.
  explicit Server(ServerConfig config);
  explicit Server(uint16_t port, const std::string& bind_addr = "0.0.0.0");
  virtual ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Accept connections until stop() (blocking). On return every session
  // thread has been shut down and joined.
  void run();

  // Request run() to return; safe from any thread or a signal-driven flag check.
  void stop() { is_running_.store(false, std::memory_order_release); }

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }

  // Configuration (before run())
  Server& set_max_connections(size_t max) {
    config_.max_connections = max;
    return *this;
  }

  Server& set_max_frame_bytes(uint32_t max) {
    config_.max_frame_bytes = max;
    return *this;
  }

  Server& set_send_timeout_ms(int timeout) {
    config_.send_timeout_ms = timeout;
    return *this;
  }

  Server& set_poll_timeout_ms(int timeout) {
    poll_timeout_ms_ = timeout;
    return *this;
  }

  Server& set_tcp_tuning(const TcpTuning& tuning) {
    config_.tcp_tuning = tuning;
    return *this;
  }

  // Status
  uint16_t port() const { return bound_port_; }
  size_t get_session_count() const { return stats_.active_sessions.load(std::memory_order_relaxed); }
  const ConnectionRegistry& registry() const { return registry_; }
  const ServerConfig& config() const { return config_; }

  // Performance monitoring
  const ServerStats& stats() const { return stats_; }

 protected:
  // Start the thread that runs one session. Throws std::system_error when
  // the thread cannot be created.
  virtual std::thread launch_worker(std::function<void()> body);

 private:
  struct Worker {
    std::thread thread;
    ConnPtr conn;
    std::shared_ptr<std::atomic<bool>> done;
  };

  ServerConfig config_;
  sockpp::tcp_acceptor acceptor_;
  uint16_t bound_port_ = 0;
  std::atomic<bool> is_running_{false};
  int poll_timeout_ms_ = 200;

  ConnectionRegistry registry_;
  ServerStats stats_;
  Broadcaster broadcaster_;

  // Touched only by the thread inside run()
  std::vector<Worker> workers_;

  void accept_connection();
  void start_session(sockpp::tcp_socket&& sock, const std::string& peer);
  void reap_finished_workers();
  void shutdown_workers();
  void apply_tcp_tuning(int fd);
};

}  // namespace tchat

#endif  // TCHAT_SERVER_HPP_
