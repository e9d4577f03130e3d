#ifndef TCHAT_CONNECTION_HPP_
#define TCHAT_CONNECTION_HPP_

#include "protocol.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <mutex>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>
#include <vector>

namespace tchat {

// ============================================================================
// Connection (blocking socket endpoint shared between session and broadcasters)
// ============================================================================

/**
 * One accepted (or connected) stream.
 *
 * Reads are performed only by the owning session thread. Writes may come from
 * any thread and are serialized per connection so frames never interleave.
 * shutdown() may be called from any thread and unblocks a pending read; the
 * descriptor itself is released in the destructor, after the last owner
 * (session, registry snapshot) drops its reference.
 */
class Connection {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  explicit Connection(sockpp::tcp_socket&& sock, std::string peer = std::string());
  explicit Connection(int fd);  // Native socket fd constructor
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- Read side (session thread only) ---

  // Returns error(kConnectionClosed) if the stream ends first, error(kSocketError) on failure.
  expected<void, ErrorCode> read_exact(uint8_t* buf, size_t len);

  expected<Message, ErrorCode> read_message(uint32_t max_body = kDefaultMaxFrameBytes);

  // --- Write side (any thread) ---

  // Send an already-encoded frame. Returns error(kConnectionClosed) after
  // shutdown(), error(kSocketError) on reset, broken pipe or send timeout.
  expected<void, ErrorCode> send_frame(const std::vector<uint8_t>& frame);

  expected<void, ErrorCode> send_message(MessageType type, std::string_view payload) {
    return send_frame(encode_frame(type, payload));
  }

  // 0 disables the timeout
  bool set_send_timeout_ms(int timeout_ms);

  // --- Lifecycle ---

  // Shut both directions down; idempotent and safe from any thread.
  void shutdown();

  bool is_closed() const { return closed_.load(std::memory_order_acquire) || !socket_.is_open(); }

  // --- Getters ---

  uint64_t get_id() const { return id_; }
  int get_fd() const { return socket_.handle(); }
  const std::string& peer() const { return peer_; }
  uint64_t bytes_in() const { return bytes_in_.load(std::memory_order_relaxed); }
  uint64_t bytes_out() const { return bytes_out_.load(std::memory_order_relaxed); }

 private:
  uint64_t id_;
  sockpp::tcp_socket socket_;
  std::string peer_;

  std::mutex tx_mutex_;
  std::atomic<bool> closed_{false};

  std::atomic<uint64_t> bytes_in_{0};
  std::atomic<uint64_t> bytes_out_{0};
};

using ConnPtr = Connection::ConnPtr;

}  // namespace tchat

#endif  // TCHAT_CONNECTION_HPP_
