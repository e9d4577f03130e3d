#include "tchat/server.hpp"

#include "tchat/log.hpp"
#include "tchat/session.hpp"

#include <cerrno>
#include <cstring>

#include <exception>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sockpp/inet_address.h>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <utility>

namespace tchat {

Server::Server(ServerConfig config) : config_(std::move(config)), broadcaster_(registry_, &stats_) {
  sockpp::initialize();

  sockpp::inet_address addr;
  try {
    addr = sockpp::inet_address(config_.host, config_.port);
  } catch (const std::exception& e) {
    TCHAT_THROW(std::runtime_error("Invalid bind address '" + config_.host + "': " + e.what()));
  }

  if (!acceptor_.open(addr, config_.max_pending)) {
    TCHAT_THROW(std::runtime_error("Failed to bind " + addr.to_string() + ": " + acceptor_.last_error_str()));
  }

  bound_port_ = acceptor_.address().port();
  TCHAT_LOG_INFO("Server listening on " + config_.host + ":" + std::to_string(bound_port_));
}

Server::Server(uint16_t port, const std::string& bind_addr)
    : Server([&]() {
        ServerConfig config;
        config.port = port;
        config.host = bind_addr;
        return config;
      }()) {}

Server::~Server() {
  stop();
  shutdown_workers();
  if (acceptor_.is_open()) {
    acceptor_.close();
  }
}

void Server::run() {
  is_running_.store(true, std::memory_order_release);
  TCHAT_LOG_INFO("Server starting...");

  while (is_running()) {
    pollfd pfd{acceptor_.handle(), POLLIN, 0};
    int ret = ::poll(&pfd, 1, poll_timeout_ms_);

    reap_finished_workers();

    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      TCHAT_LOG_ERROR(std::string("Poll error: ") + std::strerror(errno));
      break;
    }
    if (ret == 0 || !is_running()) {
      continue;
    }
    if (pfd.revents & POLLIN) {
      accept_connection();
    }
  }

  is_running_.store(false, std::memory_order_release);
  acceptor_.close();
  shutdown_workers();
  TCHAT_LOG_INFO("Server stopped");
}

void Server::accept_connection() {
  sockpp::inet_address peer;
  sockpp::tcp_socket sock = acceptor_.accept(&peer);
  if (!sock) {
    TCHAT_LOG_WARN("Error accepting connection: " + acceptor_.last_error_str());
    return;
  }

  stats_.total_connections.fetch_add(1, std::memory_order_relaxed);

  if (stats_.is_overloaded(config_.max_connections)) {
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    TCHAT_LOG_WARN("Max connections reached, refusing " + peer.to_string());
    sock.close();
    return;
  }

  TCHAT_LOG_INFO("Accepted connection from " + peer.to_string());
  start_session(std::move(sock), peer.to_string());
}

void Server::start_session(sockpp::tcp_socket&& sock, const std::string& peer) {
  apply_tcp_tuning(sock.handle());

  auto conn = std::make_shared<Connection>(std::move(sock), peer);
  if (config_.send_timeout_ms > 0 && !conn->set_send_timeout_ms(config_.send_timeout_ms)) {
    TCHAT_LOG_WARN("Could not set send timeout on " + peer);
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  stats_.active_sessions.fetch_add(1, std::memory_order_relaxed);

  std::thread thread;
  try {
    thread = launch_worker([this, conn, done]() {
      try {
        Session session(conn, broadcaster_, config_.max_frame_bytes, &stats_);
        session.run();
      } catch (const std::exception& e) {
        TCHAT_LOG_ERROR("Error handling client " + conn->peer() + ": " + e.what());
      }
      stats_.active_sessions.fetch_sub(1, std::memory_order_relaxed);
      done->store(true, std::memory_order_release);
    });
  } catch (const std::system_error& e) {
    // The accept loop keeps running; only this client is dropped
    stats_.active_sessions.fetch_sub(1, std::memory_order_relaxed);
    conn->shutdown();
    TCHAT_LOG_ERROR("Cannot start session for " + peer + ": " + e.what());
    return;
  }

  workers_.push_back(Worker{std::move(thread), std::move(conn), std::move(done)});
}

std::thread Server::launch_worker(std::function<void()> body) { return std::thread(std::move(body)); }

void Server::reap_finished_workers() {
  size_t i = 0;
  while (i < workers_.size()) {
    if (workers_[i].done->load(std::memory_order_acquire)) {
      if (workers_[i].thread.joinable()) {
        workers_[i].thread.join();
      }
      // Swap-and-pop removal
      if (i < workers_.size() - 1) {
        workers_[i] = std::move(workers_.back());
      }
      workers_.pop_back();
    } else {
      ++i;
    }
  }
}

void Server::shutdown_workers() {
  // Unblock every pending read; each session then tears itself down
  for (auto& worker : workers_) {
    worker.conn->shutdown();
  }
  for (auto& worker : workers_) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  workers_.clear();
}

void Server::apply_tcp_tuning(int fd) {
  const TcpTuning& tuning = config_.tcp_tuning;
  int opt = 1;

  if (tuning.tcp_nodelay) {
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  }

  if (tuning.so_keepalive) {
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

#ifdef TCP_KEEPIDLE
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tuning.keepalive_idle_s, sizeof(tuning.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tuning.keepalive_interval_s, sizeof(tuning.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tuning.keepalive_count, sizeof(tuning.keepalive_count));
#endif
  }
}

}  // namespace tchat
