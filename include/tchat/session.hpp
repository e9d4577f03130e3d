#ifndef TCHAT_SESSION_HPP_
#define TCHAT_SESSION_HPP_

#include "broadcaster.hpp"
#include "commands.hpp"
#include "connection.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>

namespace tchat {

// ============================================================================
// Session state (function-pointer state machine, no virtual)
// ============================================================================

enum class SessionState : uint8_t {
  kAwaitingJoin,  // Waiting for a JOIN with an unused username
  kActive,        // Registered; relaying messages and commands
  kClosing,       // Teardown in progress
  kClosed         // Terminal; no further I/O
};

const char* session_state_name(SessionState state);

class Session;

// Returns error() when the transport is unusable and the session must end
using FrameHandler = expected<void, ErrorCode> (*)(Session& session, const Message& msg);

struct StateOps {
  SessionState state;
  FrameHandler on_frame;
};

// Server-originated texts
namespace notice {

constexpr std::string_view kUsernameTaken = "Username already taken.";
constexpr std::string_view kInvalidJoin = "Invalid JOIN message.";
constexpr std::string_view kInvalidUsername = "Username may not contain '::'.";
constexpr std::string_view kInvalidFile = "Invalid FILE message.";
constexpr std::string_view kWelcome = "Welcome! Type /help for commands.";

std::string joined(std::string_view username);
std::string left(std::string_view username);

}  // namespace notice

// ============================================================================
// Session - one accepted connection from handshake to teardown
// ============================================================================

class Session {
 public:
  Session(ConnPtr conn, Broadcaster& broadcaster, uint32_t max_frame_bytes = kDefaultMaxFrameBytes,
          ServerStats* stats = nullptr);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Drive the state machine until kClosed. Blocks the calling thread.
  void run();

  SessionState get_state() const { return ops_->state; }
  const std::string& username() const { return username_; }
  const ConnPtr& connection() const { return conn_; }

  // Internal API (public to avoid friend, used by state handlers)
  void transition_to_state(SessionState state);
  expected<void, ErrorCode> reply(MessageType type, std::string_view payload);
  expected<void, ErrorCode> complete_join(std::string username);
  Broadcaster& broadcaster() { return broadcaster_; }
  CommandProcessor& commands() { return commands_; }
  ServerStats* stats() { return stats_; }

 private:
  ConnPtr conn_;
  Broadcaster& broadcaster_;
  CommandProcessor commands_;
  uint32_t max_frame_bytes_;
  ServerStats* stats_;
  const StateOps* ops_;
  std::string username_;

  void on_stream_end(ErrorCode reason);
  void teardown();
  void finish();
  // Close without logging or broadcasting; must not allocate
  void abandon();
};

}  // namespace tchat

#endif  // TCHAT_SESSION_HPP_
