#include "tchat/session.hpp"

#include "tchat/log.hpp"

#include <utility>

namespace tchat {

namespace notice {

std::string joined(std::string_view username) { return std::string(username) + " joined the chat."; }

std::string left(std::string_view username) { return std::string(username) + " left the chat."; }

}  // namespace notice

const char* session_state_name(SessionState state) {
  switch (state) {
    case SessionState::kAwaitingJoin:
      return "AWAITING_JOIN";
    case SessionState::kActive:
      return "ACTIVE";
    case SessionState::kClosing:
      return "CLOSING";
    case SessionState::kClosed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

// ============================================================================
// State handler functions
// ============================================================================

namespace detail {

expected<void, ErrorCode> awaiting_join_on_frame(Session& session, const Message& msg) {
  if (msg.type != MessageType::kJoin || msg.payload.empty()) {
    if (session.stats() != nullptr) {
      session.stats()->rejected_joins.fetch_add(1, std::memory_order_relaxed);
    }
    return session.reply(MessageType::kError, notice::kInvalidJoin);
  }
  // "::" would make "<sender>::<filename>::<data>" ambiguous for receivers
  if (msg.payload.find(kFieldSeparator) != std::string::npos) {
    if (session.stats() != nullptr) {
      session.stats()->rejected_joins.fetch_add(1, std::memory_order_relaxed);
    }
    return session.reply(MessageType::kError, notice::kInvalidUsername);
  }
  return session.complete_join(msg.payload);
}

expected<void, ErrorCode> active_on_frame(Session& session, const Message& msg) {
  switch (msg.type) {
    case MessageType::kText: {
      if (command::is_command(msg.text())) {
        auto result = session.commands().execute(session.connection(), session.username(), msg.text());
        if (!result) {
          return expected<void, ErrorCode>::error(result.get_error());
        }
        if (result.value() == CommandResult::kQuit) {
          session.transition_to_state(SessionState::kClosing);
        }
        return expected<void, ErrorCode>::success();
      }
      TCHAT_LOG_DEBUG("'" + session.username() + "' sent text (" + std::to_string(msg.payload.size()) + " bytes)");
      session.broadcaster().broadcast(MessageType::kText, make_sender_payload(session.username(), msg.payload),
                                      session.connection());
      return expected<void, ErrorCode>::success();
    }

    case MessageType::kFile: {
      auto file = parse_client_file_payload(msg.payload);
      if (!file) {
        return session.reply(MessageType::kError, notice::kInvalidFile);
      }
      TCHAT_LOG_INFO("'" + session.username() + "' sent file '" + std::string(file.value().filename) + "' (" +
                     std::to_string(file.value().data.size()) + " bytes)");
      session.broadcaster().broadcast(MessageType::kFile, make_sender_payload(session.username(), msg.payload),
                                      session.connection());
      return expected<void, ErrorCode>::success();
    }

    default:
      TCHAT_LOG_DEBUG("Ignoring " + std::string(message_type_name(msg.type)) + " (tag " +
                      std::to_string(static_cast<unsigned>(msg.type)) + ") from '" + session.username() + "'");
      return expected<void, ErrorCode>::success();
  }
}

// No frames are read once teardown has begun
expected<void, ErrorCode> closing_on_frame(Session&, const Message&) {
  return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
}

expected<void, ErrorCode> closed_on_frame(Session&, const Message&) {
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

}  // namespace detail

// State operation tables (const, zero allocation)
static const StateOps kAwaitingJoinOps = {SessionState::kAwaitingJoin, detail::awaiting_join_on_frame};
static const StateOps kActiveOps = {SessionState::kActive, detail::active_on_frame};
static const StateOps kClosingOps = {SessionState::kClosing, detail::closing_on_frame};
static const StateOps kClosedOps = {SessionState::kClosed, detail::closed_on_frame};

// ============================================================================
// Session
// ============================================================================

Session::Session(ConnPtr conn, Broadcaster& broadcaster, uint32_t max_frame_bytes, ServerStats* stats)
    : conn_(std::move(conn)),
      broadcaster_(broadcaster),
      commands_(broadcaster),
      max_frame_bytes_(max_frame_bytes),
      stats_(stats),
      ops_(&kAwaitingJoinOps) {}

void Session::run() {
  // Exception path only (e.g. allocation failure): no LEAVE is broadcast
  ScopeGuard guard([this]() { abandon(); });

  while (get_state() == SessionState::kAwaitingJoin || get_state() == SessionState::kActive) {
    auto msg = conn_->read_message(max_frame_bytes_);
    if (!msg) {
      on_stream_end(msg.get_error());
      break;
    }
    if (stats_ != nullptr) {
      stats_->total_messages_in.fetch_add(1, std::memory_order_relaxed);
    }

    auto handled = ops_->on_frame(*this, msg.value());
    if (!handled) {
      on_stream_end(handled.get_error());
      break;
    }
  }

  finish();
  guard.release();
}

void Session::finish() {
  if (get_state() == SessionState::kActive) {
    transition_to_state(SessionState::kClosing);
  }
  if (get_state() == SessionState::kClosing) {
    teardown();
  } else if (get_state() != SessionState::kClosed) {
    transition_to_state(SessionState::kClosed);
  }
}

void Session::abandon() {
  conn_->shutdown();
  broadcaster_.registry().unregister(conn_);
  ops_ = &kClosedOps;
}

void Session::transition_to_state(SessionState state) {
  TCHAT_LOG_DEBUG(conn_->peer() + ": " + session_state_name(get_state()) + " -> " + session_state_name(state));
  switch (state) {
    case SessionState::kAwaitingJoin:
      ops_ = &kAwaitingJoinOps;
      break;
    case SessionState::kActive:
      ops_ = &kActiveOps;
      break;
    case SessionState::kClosing:
      ops_ = &kClosingOps;
      break;
    case SessionState::kClosed:
      ops_ = &kClosedOps;
      conn_->shutdown();
      break;
  }
}

expected<void, ErrorCode> Session::reply(MessageType type, std::string_view payload) {
  return broadcaster_.send_direct(conn_, type, payload);
}

expected<void, ErrorCode> Session::complete_join(std::string username) {
  auto registered = broadcaster_.registry().register_user(conn_, username);
  if (!registered) {
    if (stats_ != nullptr) {
      stats_->rejected_joins.fetch_add(1, std::memory_order_relaxed);
    }
    TCHAT_LOG_INFO("JOIN as '" + username + "' from " + conn_->peer() +
                   " rejected: " + error_message(registered.get_error()));
    if (registered.get_error() == ErrorCode::kUsernameTaken) {
      return reply(MessageType::kError, notice::kUsernameTaken);
    }
    return reply(MessageType::kError, notice::kInvalidJoin);
  }

  username_ = std::move(username);
  transition_to_state(SessionState::kActive);
  TCHAT_LOG_INFO(conn_->peer() + " identified as '" + username_ + "'");

  broadcaster_.broadcast(MessageType::kJoin, notice::joined(username_), conn_);
  return reply(MessageType::kText, notice::kWelcome);
}

void Session::on_stream_end(ErrorCode reason) {
  switch (reason) {
    case ErrorCode::kMalformedHeader:
    case ErrorCode::kFrameTooLarge:
      if (stats_ != nullptr) {
        stats_->protocol_errors.fetch_add(1, std::memory_order_relaxed);
      }
      TCHAT_LOG_WARN("Protocol error from " + conn_->peer() + ": " + error_message(reason));
      break;
    case ErrorCode::kConnectionClosed:
      TCHAT_LOG_DEBUG(conn_->peer() + " closed the stream");
      break;
    default:
      TCHAT_LOG_INFO("Connection lost for " + (username_.empty() ? conn_->peer() : username_) + ": " +
                     error_message(reason));
      break;
  }

  if (get_state() == SessionState::kAwaitingJoin) {
    transition_to_state(SessionState::kClosed);
  } else if (get_state() == SessionState::kActive) {
    transition_to_state(SessionState::kClosing);
  }
}

void Session::teardown() {
  auto removed = broadcaster_.registry().unregister(conn_);
  conn_->shutdown();
  if (removed) {
    TCHAT_LOG_INFO("'" + removed.value() + "' disconnected.");
    broadcaster_.broadcast(MessageType::kLeave, notice::left(removed.value()));
  }
  transition_to_state(SessionState::kClosed);
}

}  // namespace tchat
