#include "tchat/registry.hpp"

#include "test_helpers.hpp"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace tchat;

TEST_CASE("Registry - register and list in order", "[registry]") {
  ConnectionRegistry registry;
  auto a = make_stream_pair();
  auto b = make_stream_pair();

  REQUIRE(registry.register_user(a.local, "alice").has_value());
  REQUIRE(registry.register_user(b.local, "bob").has_value());

  REQUIRE(registry.size() == 2);
  REQUIRE(registry.list_usernames() == std::vector<std::string>{"alice", "bob"});
  REQUIRE(registry.contains("alice"));
  REQUIRE(!registry.contains("carol"));
  REQUIRE(registry.username_of(b.local).value() == "bob");
}

TEST_CASE("Registry - duplicate username rejected", "[registry]") {
  ConnectionRegistry registry;
  auto a = make_stream_pair();
  auto b = make_stream_pair();

  REQUIRE(registry.register_user(a.local, "alice").has_value());
  auto dup = registry.register_user(b.local, "alice");
  REQUIRE(!dup.has_value());
  REQUIRE(dup.get_error() == ErrorCode::kUsernameTaken);
  REQUIRE(registry.size() == 1);

  // Usernames are case-sensitive
  REQUIRE(registry.register_user(b.local, "Alice").has_value());
}

TEST_CASE("Registry - connection registers once", "[registry]") {
  ConnectionRegistry registry;
  auto a = make_stream_pair();

  REQUIRE(registry.register_user(a.local, "alice").has_value());
  auto again = registry.register_user(a.local, "alice2");
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == ErrorCode::kInvalidState);

  auto null_conn = registry.register_user(nullptr, "ghost");
  REQUIRE(!null_conn.has_value());
  REQUIRE(null_conn.get_error() == ErrorCode::kInvalidArgument);
}

TEST_CASE("Registry - unregister returns former name once", "[registry]") {
  ConnectionRegistry registry;
  auto a = make_stream_pair();
  REQUIRE(registry.register_user(a.local, "alice").has_value());

  auto removed = registry.unregister(a.local);
  REQUIRE(removed.has_value());
  REQUIRE(removed.value() == "alice");
  REQUIRE(registry.size() == 0);

  REQUIRE(!registry.unregister(a.local).has_value());
  REQUIRE(!registry.username_of(a.local).has_value());

  // Name is free again
  auto b = make_stream_pair();
  REQUIRE(registry.register_user(b.local, "alice").has_value());
}

TEST_CASE("Registry - snapshot excludes sender", "[registry]") {
  ConnectionRegistry registry;
  auto a = make_stream_pair();
  auto b = make_stream_pair();
  auto c = make_stream_pair();
  REQUIRE(registry.register_user(a.local, "a").has_value());
  REQUIRE(registry.register_user(b.local, "b").has_value());
  REQUIRE(registry.register_user(c.local, "c").has_value());

  auto all = registry.snapshot_targets();
  REQUIRE(all.size() == 3);

  auto others = registry.snapshot_targets(b.local);
  REQUIRE(others.size() == 2);
  REQUIRE(others[0]->get_id() == a.local->get_id());
  REQUIRE(others[1]->get_id() == c.local->get_id());

  // An unregistered exclude changes nothing
  auto stranger = make_stream_pair();
  REQUIRE(registry.snapshot_targets(stranger.local).size() == 3);
}

TEST_CASE("Registry - snapshot is independent of later changes", "[registry]") {
  ConnectionRegistry registry;
  auto a = make_stream_pair();
  REQUIRE(registry.register_user(a.local, "a").has_value());

  auto snapshot = registry.snapshot_targets();
  registry.unregister(a.local);
  REQUIRE(snapshot.size() == 1);
  REQUIRE(registry.snapshot_targets().empty());
}

TEST_CASE("Registry - concurrent registration of one name", "[registry]") {
  ConnectionRegistry registry;
  constexpr int kThreads = 16;

  std::vector<StreamPair> pairs;
  for (int i = 0; i < kThreads; ++i) {
    pairs.push_back(make_stream_pair());
  }

  std::atomic<int> winners{0};
  std::atomic<int> taken{0};
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      auto result = registry.register_user(pairs[i].local, "contested");
      if (result) {
        ++winners;
      } else if (result.get_error() == ErrorCode::kUsernameTaken) {
        ++taken;
      }
    });
  }
  go = true;
  for (auto& t : threads) {
    t.join();
  }

  REQUIRE(winners.load() == 1);
  REQUIRE(taken.load() == kThreads - 1);
  REQUIRE(registry.size() == 1);
}

TEST_CASE("Registry - concurrent register and unregister", "[registry]") {
  ConnectionRegistry registry;
  constexpr int kThreads = 8;
  constexpr int kRounds = 200;

  std::vector<StreamPair> pairs;
  for (int i = 0; i < kThreads; ++i) {
    pairs.push_back(make_stream_pair());
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      const std::string name = "user" + std::to_string(i);
      for (int r = 0; r < kRounds; ++r) {
        if (!registry.register_user(pairs[i].local, name)) {
          ++failures;
        }
        (void)registry.snapshot_targets(pairs[i].local);
        if (!registry.unregister(pairs[i].local)) {
          ++failures;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  REQUIRE(failures.load() == 0);
  REQUIRE(registry.size() == 0);
}
