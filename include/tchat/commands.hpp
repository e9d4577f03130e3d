#ifndef TCHAT_COMMANDS_HPP_
#define TCHAT_COMMANDS_HPP_

#include "broadcaster.hpp"
#include "connection.hpp"
#include "vocabulary.hpp"

#include <string>
#include <string_view>

namespace tchat {

// ============================================================================
// In-band commands
// ============================================================================

enum class CommandResult {
  kContinue,  // Session keeps reading
  kQuit,      // Stream was shut down; session must tear down
};

namespace command {

constexpr std::string_view kQuit = "/quit";
constexpr std::string_view kUsers = "/users";
constexpr std::string_view kHelp = "/help";

constexpr std::string_view kQuitAck = "/quit_ack";
constexpr std::string_view kUsersPrefix = "[Server] Online users: ";
constexpr std::string_view kHelpText =
    "[Server] Commands:\n/users - List online users\n/send <filepath> - Send a file\n/quit - Disconnect";
constexpr std::string_view kUnknown = "Unknown command. Type /help.";

// First whitespace-delimited token, lower-cased
std::string verb_of(std::string_view line);

inline bool is_command(std::string_view text) { return !text.empty() && text.front() == '/'; }

}  // namespace command

class CommandProcessor {
 public:
  explicit CommandProcessor(Broadcaster& broadcaster) : broadcaster_(broadcaster) {}

  /**
   * @brief Execute one command line for `username` on `conn`.
   *
   * Replies go only to `conn`. A failed reply is returned as an error so the
   * session can treat it as a dead transport.
   */
  expected<CommandResult, ErrorCode> execute(const ConnPtr& conn, std::string_view username, std::string_view line);

 private:
  Broadcaster& broadcaster_;
};

}  // namespace tchat

#endif  // TCHAT_COMMANDS_HPP_
