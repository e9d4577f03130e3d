#include "tchat/connection.hpp"

#include "tchat/log.hpp"

#include <cerrno>
#include <cstring>

#include <chrono>
#include <sys/socket.h>

namespace tchat {

static std::atomic<uint64_t> g_next_conn_id{1};

Connection::Connection(sockpp::tcp_socket&& sock, std::string peer)
    : id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)), socket_(std::move(sock)), peer_(std::move(peer)) {
  if (peer_.empty()) {
    peer_ = "conn#" + std::to_string(id_);
  }
}

Connection::Connection(int fd)
    : id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)),
      socket_(fd),
      peer_("fd#" + std::to_string(fd)) {}

Connection::~Connection() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

expected<void, ErrorCode> Connection::read_exact(uint8_t* buf, size_t len) {
  size_t got = 0;
  while (got < len) {
    ssize_t n = socket_.read(buf + got, len - got);
    if (n > 0) {
      got += static_cast<size_t>(n);
      continue;
    }
    if (n == 0) {
      return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    int err = socket_.last_error();
    if (err == EINTR) {
      continue;
    }
    // A read failing because we shut the socket down is an orderly end
    if (closed_.load(std::memory_order_acquire)) {
      return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    TCHAT_LOG_DEBUG("read error on " + peer_ + ": " + std::strerror(err));
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  bytes_in_.fetch_add(len, std::memory_order_relaxed);
  return expected<void, ErrorCode>::success();
}

expected<Message, ErrorCode> Connection::read_message(uint32_t max_body) {
  return decode_frame(
      [this](uint8_t* buf, size_t len) { return read_exact(buf, len); }, max_body);
}

expected<void, ErrorCode> Connection::send_frame(const std::vector<uint8_t>& frame) {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  if (is_closed()) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  const uint8_t* p = frame.data();
  size_t left = frame.size();
  while (left > 0) {
    // MSG_NOSIGNAL: a vanished peer must surface as EPIPE, not SIGPIPE
    ssize_t n = ::send(socket_.handle(), p, left, MSG_NOSIGNAL);
    if (n > 0) {
      p += n;
      left -= static_cast<size_t>(n);
      continue;
    }
    int err = errno;
    if (n < 0 && err == EINTR) {
      continue;
    }
    if (n < 0 && (err == EAGAIN || err == EWOULDBLOCK)) {
      TCHAT_LOG_DEBUG("send timeout on " + peer_);
    } else {
      TCHAT_LOG_DEBUG("send error on " + peer_ + ": " + std::strerror(err));
    }
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  bytes_out_.fetch_add(frame.size(), std::memory_order_relaxed);
  return expected<void, ErrorCode>::success();
}

bool Connection::set_send_timeout_ms(int timeout_ms) {
  if (timeout_ms < 0) {
    return false;
  }
  return socket_.write_timeout(std::chrono::milliseconds(timeout_ms));
}

void Connection::shutdown() {
  bool expected_open = false;
  if (!closed_.compare_exchange_strong(expected_open, true, std::memory_order_acq_rel)) {
    return;
  }
  // sockpp's last-error slot belongs to the reading thread
  if (socket_.is_open()) {
    ::shutdown(socket_.handle(), SHUT_RDWR);
  }
}

}  // namespace tchat
