#include "tchat/session.hpp"

#include "tchat/log.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <iostream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

using namespace tchat;

// ============================================================================
// Helper: one session driven on its own thread over a socketpair
// ============================================================================

class SessionRunner {
 public:
  explicit SessionRunner(Broadcaster& broadcaster, ServerStats* stats = nullptr,
                         uint32_t max_frame_bytes = kDefaultMaxFrameBytes)
      : pair_(make_stream_pair(2000, true)) {
    thread_ = std::thread([this, &broadcaster, stats, max_frame_bytes]() {
      Session session(pair_.local, broadcaster, max_frame_bytes, stats);
      session.run();
      final_state_ = session.get_state();
    });
  }

  ~SessionRunner() {
    pair_.remote->shutdown();
    join();
  }

  void join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void send(MessageType type, const std::string& payload) {
    REQUIRE(pair_.remote->send_message(type, payload).has_value());
  }

  Message receive() { return expect_message(pair_.remote); }

  void join_as(const std::string& username) {
    send(MessageType::kJoin, username);
    Message welcome = receive();
    REQUIRE(welcome.type == MessageType::kText);
    REQUIRE(welcome.payload == notice::kWelcome);
  }

  // Wait for the server side to close the stream
  void expect_closed() {
    auto eof = pair_.remote->read_message();
    REQUIRE(!eof.has_value());
    REQUIRE(eof.get_error() == ErrorCode::kConnectionClosed);
    join();
    REQUIRE(final_state_ == SessionState::kClosed);
  }

  const ConnPtr& client() const { return pair_.remote; }
  const ConnPtr& server_side() const { return pair_.local; }

 private:
  StreamPair pair_;
  std::thread thread_;
  SessionState final_state_ = SessionState::kAwaitingJoin;
};

struct SessionFixture {
  ConnectionRegistry registry;
  ServerStats stats;
  Broadcaster broadcaster{registry, &stats};
};

// ============================================================================
// Handshake
// ============================================================================

TEST_CASE("Session - JOIN registers and welcomes", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");

  REQUIRE(f.registry.contains("alice"));
  REQUIRE(f.registry.username_of(alice.server_side()).value() == "alice");
}

TEST_CASE("Session - non-JOIN before identification", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);

  alice.send(MessageType::kText, "hello?");
  Message err = alice.receive();
  REQUIRE(err.type == MessageType::kError);
  REQUIRE(err.payload == "Invalid JOIN message.");
  REQUIRE(f.registry.size() == 0);

  // Still waiting for a JOIN
  alice.join_as("alice");
  REQUIRE(f.stats.rejected_joins.load() == 1);
}

TEST_CASE("Session - empty username", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);

  alice.send(MessageType::kJoin, "");
  Message err = alice.receive();
  REQUIRE(err.type == MessageType::kError);
  REQUIRE(err.payload == "Invalid JOIN message.");
  alice.join_as("alice");
}

TEST_CASE("Session - username with separator", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);

  alice.send(MessageType::kJoin, "al::ice");
  Message err = alice.receive();
  REQUIRE(err.type == MessageType::kError);
  REQUIRE(err.payload == notice::kInvalidUsername);
  REQUIRE(f.registry.size() == 0);
}

TEST_CASE("Session - taken username then retry", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");

  SessionRunner impostor(f.broadcaster, &f.stats);
  impostor.send(MessageType::kJoin, "alice");
  Message err = impostor.receive();
  REQUIRE(err.type == MessageType::kError);
  REQUIRE(err.payload == "Username already taken.");

  impostor.join_as("alice2");
  Message joined = alice.receive();
  REQUIRE(joined.type == MessageType::kJoin);
  REQUIRE(joined.payload == "alice2 joined the chat.");
  REQUIRE(f.registry.list_usernames() == std::vector<std::string>{"alice", "alice2"});
}

TEST_CASE("Session - JOIN announcement excludes the newcomer", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");
  SessionRunner bob(f.broadcaster, &f.stats);
  bob.join_as("bob");

  Message joined = alice.receive();
  REQUIRE(joined.type == MessageType::kJoin);
  REQUIRE(joined.payload == "bob joined the chat.");
  REQUIRE(!has_pending(bob.client()));
}

// ============================================================================
// Relaying
// ============================================================================

TEST_CASE("Session - text relayed with sender prefix", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");
  SessionRunner bob(f.broadcaster, &f.stats);
  bob.join_as("bob");
  alice.receive();  // bob joined

  alice.send(MessageType::kText, "hi bob");
  Message msg = bob.receive();
  REQUIRE(msg.type == MessageType::kText);
  REQUIRE(msg.payload == "alice::hi bob");
  REQUIRE(!has_pending(alice.client()));
}

TEST_CASE("Session - file relayed with sender prefix", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");
  SessionRunner bob(f.broadcaster, &f.stats);
  bob.join_as("bob");
  alice.receive();

  std::string data("bin\0ary::stuff", 14);
  alice.send(MessageType::kFile, "notes.txt::" + data);
  Message msg = bob.receive();
  REQUIRE(msg.type == MessageType::kFile);
  REQUIRE(msg.payload == "alice::notes.txt::" + data);

  auto file = split_file_payload(msg.payload);
  REQUIRE(file.has_value());
  REQUIRE(file.value().filename == "notes.txt");
  REQUIRE(file.value().data == data);
}

TEST_CASE("Session - malformed file rejected, session continues", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");
  SessionRunner bob(f.broadcaster, &f.stats);
  bob.join_as("bob");
  alice.receive();

  alice.send(MessageType::kFile, "no separator at all");
  Message err = alice.receive();
  REQUIRE(err.type == MessageType::kError);
  REQUIRE(err.payload == "Invalid FILE message.");
  REQUIRE(!has_pending(bob.client()));

  alice.send(MessageType::kText, "still here");
  REQUIRE(bob.receive().payload == "alice::still here");
}

TEST_CASE("Session - other tags ignored while active", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");

  alice.send(MessageType::kJoin, "again");
  REQUIRE(alice.client()->send_frame({0x00, 0x00, 0x00, 0x02, 0x63, 'x'}).has_value());
  alice.send(MessageType::kText, "/users");

  Message msg = alice.receive();
  REQUIRE(msg.type == MessageType::kText);
  REQUIRE(msg.payload == "[Server] Online users: alice");
  REQUIRE(f.registry.size() == 1);
}

// ============================================================================
// Teardown
// ============================================================================

TEST_CASE("Session - disconnect announces exactly one LEAVE", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");
  SessionRunner bob(f.broadcaster, &f.stats);
  bob.join_as("bob");
  alice.receive();

  bob.client()->shutdown();
  bob.join();

  Message left = alice.receive();
  REQUIRE(left.type == MessageType::kLeave);
  REQUIRE(left.payload == "bob left the chat.");
  REQUIRE(!has_pending(alice.client()));
  REQUIRE(f.registry.list_usernames() == std::vector<std::string>{"alice"});
}

TEST_CASE("Session - /quit acknowledges then leaves", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");
  SessionRunner bob(f.broadcaster, &f.stats);
  bob.join_as("bob");
  alice.receive();

  bob.send(MessageType::kText, "/quit");
  Message ack = bob.receive();
  REQUIRE(ack.type == MessageType::kCommand);
  REQUIRE(ack.payload == "/quit_ack");
  bob.expect_closed();

  Message left = alice.receive();
  REQUIRE(left.type == MessageType::kLeave);
  REQUIRE(left.payload == "bob left the chat.");
  REQUIRE(!f.registry.contains("bob"));
}

TEST_CASE("Session - disconnect before JOIN is silent", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");

  {
    SessionRunner anonymous(f.broadcaster, &f.stats);
    anonymous.client()->shutdown();
    anonymous.join();
  }

  REQUIRE(!has_pending(alice.client()));
  REQUIRE(f.stats.total_broadcasts.load() == 1);  // Only alice's own JOIN
}

TEST_CASE("Session - oversize frame drops the connection", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);
  alice.join_as("alice");
  SessionRunner bob(f.broadcaster, &f.stats, 64);
  bob.join_as("bob");
  alice.receive();

  bob.send(MessageType::kText, std::string(200, 'x'));
  bob.expect_closed();

  Message left = alice.receive();
  REQUIRE(left.type == MessageType::kLeave);
  REQUIRE(left.payload == "bob left the chat.");
  REQUIRE(f.stats.protocol_errors.load() == 1);
}

TEST_CASE("Session - malformed length drops the connection", "[session]") {
  SessionFixture f;
  SessionRunner alice(f.broadcaster, &f.stats);

  REQUIRE(alice.client()->send_frame({0x00, 0x00, 0x00, 0x00}).has_value());
  alice.expect_closed();
  REQUIRE(f.stats.protocol_errors.load() == 1);
  REQUIRE(f.registry.size() == 0);
}

TEST_CASE("Session - state names", "[session]") {
  REQUIRE(std::string(session_state_name(SessionState::kAwaitingJoin)) == "AWAITING_JOIN");
  REQUIRE(std::string(session_state_name(SessionState::kActive)) == "ACTIVE");
  REQUIRE(std::string(session_state_name(SessionState::kClosing)) == "CLOSING");
  REQUIRE(std::string(session_state_name(SessionState::kClosed)) == "CLOSED");
}

// ============================================================================
// Exceptions escaping a session
// ============================================================================

namespace {

class FailingBuf : public std::streambuf {
 protected:
  int_type overflow(int_type) override { throw std::runtime_error("log sink failed"); }
  std::streamsize xsputn(const char*, std::streamsize) override { throw std::runtime_error("log sink failed"); }
};

// Makes every write to std::cerr throw until destroyed
class ThrowingCerr {
 public:
  ThrowingCerr() : saved_level_(Logger::level()) {
    Logger::set_level(Logger::Level::kInfo);
    std::cerr.exceptions(std::ios::badbit);
    old_ = std::cerr.rdbuf(&buf_);
  }

  ~ThrowingCerr() {
    std::cerr.exceptions(std::ios::goodbit);
    std::cerr.rdbuf(old_);
    Logger::set_level(saved_level_);
  }

 private:
  FailingBuf buf_;
  std::streambuf* old_;
  Logger::Level saved_level_;
};

}  // namespace

TEST_CASE("Session - Exception during JOIN unregisters without LEAVE", "[session]") {
  SessionFixture f;
  StreamPair alice = make_stream_pair();
  REQUIRE(f.registry.register_user(alice.local, "alice").has_value());

  StreamPair bob = make_stream_pair();
  REQUIRE(bob.remote->send_message(MessageType::kJoin, "bob").has_value());

  Session session(bob.local, f.broadcaster);
  {
    // The first INFO line after registration throws
    ThrowingCerr sink;
    REQUIRE_THROWS_AS(session.run(), std::runtime_error);
  }

  REQUIRE(session.get_state() == SessionState::kClosed);
  REQUIRE(f.registry.size() == 1);
  REQUIRE(!f.registry.contains("bob"));
  REQUIRE(!has_pending(alice.remote));

  auto eof = bob.remote->read_message();
  REQUIRE(!eof.has_value());
  REQUIRE(eof.get_error() == ErrorCode::kConnectionClosed);
}
