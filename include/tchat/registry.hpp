#ifndef TCHAT_REGISTRY_HPP_
#define TCHAT_REGISTRY_HPP_

#include "connection.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tchat {

// ============================================================================
// ConnectionRegistry - live, named connections
// ============================================================================

/**
 * @brief Thread-safe mapping connection -> username.
 *
 * Usernames are pairwise distinct (case-sensitive) and a connection appears at
 * most once. A single mutex covers both mutation and snapshots; snapshots are
 * copied out so callers never hold the lock across network I/O.
 * Entries are kept in registration order.
 */
class ConnectionRegistry {
 public:
  // Check-and-insert under one lock.
  // Returns error(kUsernameTaken) or error(kInvalidState) if conn is already registered.
  expected<void, ErrorCode> register_user(const ConnPtr& conn, std::string username);

  // Returns the former username, or nothing if conn was not registered.
  optional<std::string> unregister(const ConnPtr& conn);

  // All registered connections except `exclude` (may be null), at one instant.
  std::vector<ConnPtr> snapshot_targets(const ConnPtr& exclude = nullptr) const;

  std::vector<std::string> list_usernames() const;

  optional<std::string> username_of(const ConnPtr& conn) const;
  bool contains(std::string_view username) const;
  size_t size() const;

 private:
  struct Entry {
    uint64_t conn_id;
    ConnPtr conn;
    std::string username;
  };

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

}  // namespace tchat

#endif  // TCHAT_REGISTRY_HPP_
