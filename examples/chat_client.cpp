#include "tchat.hpp"

#include <csignal>

#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace {

std::mutex g_console_mutex;

std::string timestamp() {
  char stamp[16] = "??:??:??";
  std::time_t now = std::time(nullptr);
  std::tm tm_buf{};
  if (::localtime_r(&now, &tm_buf) != nullptr) {
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm_buf);
  }
  return stamp;
}

// Print a received line and re-prompt
void print_event(const std::string& username, const std::string& line) {
  std::lock_guard<std::mutex> lock(g_console_mutex);
  std::cout << "\n[" << timestamp() << "] " << line << "\n" << username << "> " << std::flush;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string error;
  auto parsed = tchat::parse_client_args(argc, argv, &error);
  if (!parsed) {
    std::cerr << "Error: " << error << "\n" << tchat::client_usage(argv[0]);
    return 1;
  }
  const tchat::ClientConfig& config = parsed.value();
  if (config.show_help) {
    std::cout << tchat::client_usage(argv[0]);
    return 0;
  }

  tchat::Logger::set_level(config.log_level);
  std::signal(SIGPIPE, SIG_IGN);

  tchat::ChatClient client(config);
  const std::string& me = config.username;

  client.on_text = [&me](std::string_view sender, std::string_view text) {
    print_event(me, std::string(sender) + ": " + std::string(text));
  };
  client.on_notice = [&me](std::string_view notice) { print_event(me, std::string(notice)); };
  client.on_error = [&me](std::string_view message) { print_event(me, "[Server Error]: " + std::string(message)); };
  client.on_file = [&me](std::string_view sender, std::string_view filename, size_t size,
                         const std::string& saved_to) {
    print_event(me, std::string(sender) + " sent a file: '" + std::string(filename) + "' (" + std::to_string(size) +
                        " bytes)\n[File saved to: " + saved_to + "]");
  };

  if (!client.connect()) {
    return 1;
  }

  std::thread receiver([&client]() { client.run_receive_loop(); });

  TCHAT_LOG_INFO("You can start chatting. Type /help for commands.");
  std::string line;
  while (client.is_running()) {
    {
      std::lock_guard<std::mutex> lock(g_console_mutex);
      std::cout << me << "> " << std::flush;
    }
    if (!std::getline(std::cin, line)) {
      // EOF on stdin behaves like /quit
      if (client.is_running() && !client.send_text(tchat::command::kQuit)) {
        client.disconnect();
      }
      break;
    }
    if (!client.is_running()) {
      break;
    }

    auto action = client.submit_line(line);
    if (!action) {
      if (action.get_error() != tchat::ErrorCode::kInvalidArgument) {
        break;
      }
      continue;
    }
    if (action.value() == tchat::InputAction::kQuit) {
      break;
    }
    if (action.value() == tchat::InputAction::kLocalHelp) {
      std::cout << tchat::kClientHelpText << std::endl;
    } else if (action.value() == tchat::InputAction::kUsage) {
      std::cout << "Usage: /send <path/to/your/file>" << std::endl;
    }
  }

  std::cout << "Closing client..." << std::endl;
  receiver.join();
  std::cout << "Client closed." << std::endl;
  return 0;
}
