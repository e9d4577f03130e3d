#include "tchat/broadcaster.hpp"

#include "tchat/log.hpp"

#include <string>
#include <vector>

namespace tchat {

size_t Broadcaster::broadcast(MessageType type, std::string_view payload, const ConnPtr& exclude) {
  const std::vector<uint8_t> frame = encode_frame(type, payload);
  const std::vector<ConnPtr> targets = registry_.snapshot_targets(exclude);

  if (stats_ != nullptr) {
    stats_->total_broadcasts.fetch_add(1, std::memory_order_relaxed);
  }

  size_t delivered = 0;
  for (const auto& target : targets) {
    auto result = target->send_frame(frame);
    if (result) {
      ++delivered;
      continue;
    }
    // Target may have left after the snapshot was taken
    TCHAT_LOG_WARN("Broadcast of " + std::string(message_type_name(type)) + " to " + target->peer() +
                   " failed: " + error_message(result.get_error()));
    if (stats_ != nullptr) {
      stats_->send_failures.fetch_add(1, std::memory_order_relaxed);
    }
  }

  if (stats_ != nullptr) {
    stats_->total_messages_out.fetch_add(delivered, std::memory_order_relaxed);
  }
  return delivered;
}

expected<void, ErrorCode> Broadcaster::send_direct(const ConnPtr& conn, MessageType type, std::string_view payload) {
  if (!conn) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  auto result = conn->send_message(type, payload);
  if (!result) {
    TCHAT_LOG_WARN("Failed to send " + std::string(message_type_name(type)) + " to " + conn->peer() + ": " +
                   error_message(result.get_error()));
    if (stats_ != nullptr) {
      stats_->send_failures.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
  }
  if (stats_ != nullptr) {
    stats_->total_messages_out.fetch_add(1, std::memory_order_relaxed);
  }
  return result;
}

}  // namespace tchat
