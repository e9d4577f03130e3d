#ifndef TCHAT_CLIENT_HPP_
#define TCHAT_CLIENT_HPP_

#include "config.hpp"
#include "connection.hpp"
#include "protocol.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <functional>
#include <string>
#include <string_view>

namespace tchat {

// What submit_line() did with one line of user input
enum class InputAction : uint8_t {
  kSent,       // Forwarded to the server (TEXT, command or FILE)
  kQuit,       // "/quit" sent; the caller should stop reading input
  kLocalHelp,  // Client-side help requested; nothing sent
  kUsage,      // "/send" without a path; nothing sent
  kIgnored     // Empty line
};

constexpr std::string_view kClientHelpText =
    "Commands:\n  /users - List online users\n  /send <filepath> - Send a file\n  /quit - Disconnect";

// ============================================================================
// ChatClient - client side of the framed chat protocol
// ============================================================================

class ChatClient {
 public:
  explicit ChatClient(ClientConfig config);
  ~ChatClient();

  ChatClient(const ChatClient&) = delete;
  ChatClient& operator=(const ChatClient&) = delete;

  // Connect and send JOIN. Returns error(kSocketError) if the server is unreachable.
  expected<void, ErrorCode> connect();

  // Adopt an already-connected stream and send JOIN (tests, custom transports)
  expected<void, ErrorCode> attach(ConnPtr conn);

  // Blocking receive loop; returns on disconnect, stream error or /quit_ack.
  void run_receive_loop();

  // Dispatch one received message to the callbacks
  void handle_message(const Message& msg);

  expected<void, ErrorCode> send_text(std::string_view text);

  // Send the file at `path` as "<basename>::<bytes>"
  expected<void, ErrorCode> send_file(const std::string& path);

  // Interpret one line typed by the user
  expected<InputAction, ErrorCode> submit_line(std::string_view line);

  // Write received bytes to download_dir/<basename(filename)>; returns the path written.
  expected<std::string, ErrorCode> save_received_file(std::string_view filename, std::string_view data) const;

  // Shut the stream down; unblocks run_receive_loop()
  void disconnect();

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }
  const ClientConfig& config() const { return config_; }

  // Callbacks (invoked on the receive-loop thread)
  std::function<void(std::string_view sender, std::string_view text)> on_text;
  std::function<void(std::string_view notice)> on_notice;  // Server texts, JOIN and LEAVE announcements
  std::function<void(std::string_view message)> on_error;
  std::function<void(std::string_view sender, std::string_view filename, size_t size, const std::string& saved_to)>
      on_file;
  std::function<void()> on_disconnect;

 private:
  ClientConfig config_;
  ConnPtr conn_;
  std::atomic<bool> is_running_{false};

  void handle_file(std::string_view payload);
  void report_error(std::string_view message);
};

}  // namespace tchat

#endif  // TCHAT_CLIENT_HPP_
