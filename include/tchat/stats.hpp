#ifndef TCHAT_STATS_HPP_
#define TCHAT_STATS_HPP_

#include <cstddef>
#include <cstdint>

#include <atomic>

namespace tchat {

// ============================================================================
// ServerStats - Atomic counters
// ============================================================================

struct ServerStats {
  // Throughput counters
  std::atomic<uint64_t> total_messages_in{0};
  std::atomic<uint64_t> total_messages_out{0};
  std::atomic<uint64_t> total_broadcasts{0};

  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_sessions{0};
  std::atomic<uint64_t> rejected_connections{0};

  // Error counters
  std::atomic<uint64_t> rejected_joins{0};
  std::atomic<uint64_t> protocol_errors{0};
  std::atomic<uint64_t> send_failures{0};

  void reset() {
    total_messages_in = 0;
    total_messages_out = 0;
    total_broadcasts = 0;
    total_connections = 0;
    active_sessions = 0;
    rejected_connections = 0;
    rejected_joins = 0;
    protocol_errors = 0;
    send_failures = 0;
  }

  // True when no further session may be started
  bool is_overloaded(size_t max_sessions) const {
    return active_sessions.load(std::memory_order_relaxed) >= max_sessions;
  }
};

}  // namespace tchat

#endif  // TCHAT_STATS_HPP_
