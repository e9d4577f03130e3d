#include "tchat/registry.hpp"

#include <algorithm>

namespace tchat {

expected<void, ErrorCode> ConnectionRegistry::register_user(const ConnPtr& conn, std::string username) {
  if (!conn) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = conn->get_id();
  for (const auto& entry : entries_) {
    if (entry.conn_id == id) {
      return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
    }
    if (entry.username == username) {
      return expected<void, ErrorCode>::error(ErrorCode::kUsernameTaken);
    }
  }
  entries_.push_back(Entry{id, conn, std::move(username)});
  return expected<void, ErrorCode>::success();
}

optional<std::string> ConnectionRegistry::unregister(const ConnPtr& conn) {
  if (!conn) {
    return {};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = conn->get_id();
  auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.conn_id == id; });
  if (it == entries_.end()) {
    return {};
  }
  std::string username = std::move(it->username);
  entries_.erase(it);
  return username;
}

std::vector<ConnPtr> ConnectionRegistry::snapshot_targets(const ConnPtr& exclude) const {
  const uint64_t excluded_id = exclude ? exclude->get_id() : 0;

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnPtr> targets;
  targets.reserve(entries_.size());
  for (const auto& entry : entries_) {
    if (exclude && entry.conn_id == excluded_id) {
      continue;
    }
    targets.push_back(entry.conn);
  }
  return targets;
}

std::vector<std::string> ConnectionRegistry::list_usernames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& entry : entries_) {
    names.push_back(entry.username);
  }
  return names;
}

optional<std::string> ConnectionRegistry::username_of(const ConnPtr& conn) const {
  if (!conn) {
    return {};
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : entries_) {
    if (entry.conn_id == conn->get_id()) {
      return entry.username;
    }
  }
  return {};
}

bool ConnectionRegistry::contains(std::string_view username) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(entries_.begin(), entries_.end(),
                     [username](const Entry& e) { return e.username == username; });
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace tchat
