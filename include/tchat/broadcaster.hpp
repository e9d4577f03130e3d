#ifndef TCHAT_BROADCASTER_HPP_
#define TCHAT_BROADCASTER_HPP_

#include "connection.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstddef>

#include <string_view>

namespace tchat {

// ============================================================================
// Broadcaster - fan-out and direct delivery
// ============================================================================

class Broadcaster {
 public:
  explicit Broadcaster(ConnectionRegistry& registry, ServerStats* stats = nullptr)
      : registry_(registry), stats_(stats) {}

  /**
   * @brief Send one message to every registered connection except `exclude`.
   *
   * The frame is encoded once and the target list is copied out of the
   * registry before any send. A failed target is logged and skipped; the
   * failure never reaches the caller. Best effort, no retry.
   *
   * @return Number of targets the frame was written to
   */
  size_t broadcast(MessageType type, std::string_view payload, const ConnPtr& exclude = nullptr);

  /**
   * @brief Send one message to a single connection and report the outcome.
   */
  expected<void, ErrorCode> send_direct(const ConnPtr& conn, MessageType type, std::string_view payload);

  ConnectionRegistry& registry() { return registry_; }

 private:
  ConnectionRegistry& registry_;
  ServerStats* stats_;
};

}  // namespace tchat

#endif  // TCHAT_BROADCASTER_HPP_
