#include "tchat/commands.hpp"

#include "tchat/log.hpp"

#include <cctype>

#include <vector>

namespace tchat {

namespace command {

std::string verb_of(std::string_view line) {
  size_t start = 0;
  while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) {
    ++start;
  }
  size_t end = start;
  while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) {
    ++end;
  }
  std::string verb(line.substr(start, end - start));
  for (auto& c : verb) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return verb;
}

}  // namespace command

expected<CommandResult, ErrorCode> CommandProcessor::execute(const ConnPtr& conn, std::string_view username,
                                                             std::string_view line) {
  const std::string verb = command::verb_of(line);
  TCHAT_LOG_DEBUG("'" + std::string(username) + "' issued " + verb);

  if (verb == command::kQuit) {
    auto sent = broadcaster_.send_direct(conn, MessageType::kCommand, command::kQuitAck);
    // The stream is closed either way; the session's teardown announces the departure
    conn->shutdown();
    if (!sent) {
      return expected<CommandResult, ErrorCode>::error(sent.get_error());
    }
    return expected<CommandResult, ErrorCode>::success(CommandResult::kQuit);
  }

  expected<void, ErrorCode> sent = expected<void, ErrorCode>::success();
  if (verb == command::kUsers) {
    std::string reply(command::kUsersPrefix);
    const std::vector<std::string> names = broadcaster_.registry().list_usernames();
    for (size_t i = 0; i < names.size(); ++i) {
      if (i > 0) {
        reply += ", ";
      }
      reply += names[i];
    }
    sent = broadcaster_.send_direct(conn, MessageType::kText, reply);
  } else if (verb == command::kHelp) {
    sent = broadcaster_.send_direct(conn, MessageType::kText, command::kHelpText);
  } else {
    sent = broadcaster_.send_direct(conn, MessageType::kError, command::kUnknown);
  }

  if (!sent) {
    return expected<CommandResult, ErrorCode>::error(sent.get_error());
  }
  return expected<CommandResult, ErrorCode>::success(CommandResult::kContinue);
}

}  // namespace tchat
