#include "tchat/client.hpp"

#include "tchat/commands.hpp"
#include "tchat/log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sockpp/inet_address.h>
#include <sockpp/tcp_connector.h>
#include <system_error>
#include <utility>

namespace tchat {

namespace {

constexpr std::string_view kServerPrefix = "[Server]";
constexpr std::string_view kSendPrefix = "/send ";

std::string to_lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

// Last path component of a sender-chosen name, or empty if unusable
std::string safe_basename(std::string_view filename) {
  size_t slash = filename.find_last_of("/\\");
  if (slash != std::string_view::npos) {
    filename.remove_prefix(slash + 1);
  }
  if (filename == "." || filename == "..") {
    return std::string();
  }
  return std::string(filename);
}

}  // namespace

ChatClient::ChatClient(ClientConfig config) : config_(std::move(config)) {}

ChatClient::~ChatClient() { disconnect(); }

expected<void, ErrorCode> ChatClient::connect() {
  sockpp::initialize();

  sockpp::tcp_connector connector;
  try {
    if (!connector.connect(sockpp::inet_address(config_.host, config_.port))) {
      TCHAT_LOG_ERROR("Failed to connect to " + config_.host + ":" + std::to_string(config_.port) + ": " +
                      connector.last_error_str());
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
  } catch (const std::exception& e) {
    TCHAT_LOG_ERROR("Cannot resolve '" + config_.host + "': " + e.what());
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  TCHAT_LOG_INFO("Connected to server at " + config_.host + ":" + std::to_string(config_.port));
  return attach(std::make_shared<Connection>(std::move(connector), config_.host));
}

expected<void, ErrorCode> ChatClient::attach(ConnPtr conn) {
  if (!conn) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  conn_ = std::move(conn);

  auto sent = conn_->send_message(MessageType::kJoin, config_.username);
  if (!sent) {
    TCHAT_LOG_ERROR(std::string("Failed to send JOIN: ") + error_message(sent.get_error()));
    conn_->shutdown();
    return sent;
  }
  is_running_.store(true, std::memory_order_release);
  return expected<void, ErrorCode>::success();
}

void ChatClient::run_receive_loop() {
  while (is_running() && conn_) {
    auto msg = conn_->read_message(config_.max_frame_bytes);
    if (!msg) {
      if (is_running()) {
        if (msg.get_error() == ErrorCode::kConnectionClosed) {
          TCHAT_LOG_INFO("Disconnected from server.");
        } else {
          TCHAT_LOG_INFO(std::string("Connection to server lost: ") + error_message(msg.get_error()));
        }
      }
      break;
    }
    handle_message(msg.value());
  }

  is_running_.store(false, std::memory_order_release);
  if (conn_) {
    conn_->shutdown();
  }
  if (on_disconnect) {
    on_disconnect();
  }
}

void ChatClient::handle_message(const Message& msg) {
  std::string_view payload = msg.text();

  switch (msg.type) {
    case MessageType::kText: {
      if (payload.substr(0, kServerPrefix.size()) == kServerPrefix) {
        if (on_notice) {
          on_notice(payload);
        }
        break;
      }
      auto text = split_text_payload(payload);
      if (!text) {
        // Unattributed server text such as the welcome line
        if (on_notice) {
          on_notice(payload);
        }
      } else if (on_text) {
        on_text(text.value().sender, text.value().text);
      }
      break;
    }

    case MessageType::kFile:
      handle_file(payload);
      break;

    case MessageType::kJoin:
    case MessageType::kLeave:
      if (on_notice) {
        on_notice(payload);
      }
      break;

    case MessageType::kError:
      report_error(payload);
      break;

    case MessageType::kCommand:
      if (payload == command::kQuitAck) {
        TCHAT_LOG_INFO("Quit acknowledged by server. Disconnecting.");
        is_running_.store(false, std::memory_order_release);
      }
      break;

    default:
      TCHAT_LOG_DEBUG("Ignoring message with tag " + std::to_string(static_cast<unsigned>(msg.type)));
      break;
  }
}

void ChatClient::handle_file(std::string_view payload) {
  auto file = split_file_payload(payload);
  if (!file) {
    report_error("Received malformed file message.");
    return;
  }

  const FilePayload& f = file.value();
  TCHAT_LOG_INFO(std::string(f.sender) + " sent a file: '" + std::string(f.filename) + "' (" +
                 std::to_string(f.data.size()) + " bytes)");

  auto saved = save_received_file(f.filename, f.data);
  if (!saved) {
    report_error("Error saving file '" + std::string(f.filename) + "': " + error_message(saved.get_error()));
    return;
  }
  if (on_file) {
    on_file(f.sender, f.filename, f.data.size(), saved.value());
  }
}

void ChatClient::report_error(std::string_view message) {
  if (on_error) {
    on_error(message);
  } else {
    TCHAT_LOG_WARN(std::string(message));
  }
}

expected<void, ErrorCode> ChatClient::send_text(std::string_view text) {
  if (!conn_) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  auto sent = conn_->send_message(MessageType::kText, text);
  if (!sent) {
    TCHAT_LOG_ERROR("Cannot send message. Connection lost.");
    is_running_.store(false, std::memory_order_release);
  }
  return sent;
}

expected<void, ErrorCode> ChatClient::send_file(const std::string& path) {
  if (!conn_) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    TCHAT_LOG_ERROR("File not found: '" + path + "'");
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }

  std::string filename = std::filesystem::path(path).filename().string();
  if (filename.empty() || filename.find(kFieldSeparator) != std::string::npos) {
    TCHAT_LOG_ERROR("Cannot send '" + path + "': file names may not contain '::'");
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    TCHAT_LOG_ERROR("Error reading file '" + path + "'");
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  auto sent = conn_->send_message(MessageType::kFile, make_file_payload(filename, data));
  if (!sent) {
    TCHAT_LOG_ERROR("Cannot send file. Connection lost.");
    is_running_.store(false, std::memory_order_release);
    return sent;
  }
  TCHAT_LOG_INFO("Sent file '" + filename + "' (" + std::to_string(data.size()) + " bytes)");
  return sent;
}

expected<InputAction, ErrorCode> ChatClient::submit_line(std::string_view line) {
  if (line.empty()) {
    return expected<InputAction, ErrorCode>::success(InputAction::kIgnored);
  }

  std::string lowered = to_lower(line);
  InputAction action = InputAction::kSent;
  expected<void, ErrorCode> sent = expected<void, ErrorCode>::success();

  if (lowered == command::kQuit) {
    sent = send_text(line);
    action = InputAction::kQuit;
  } else if (lowered == command::kHelp) {
    return expected<InputAction, ErrorCode>::success(InputAction::kLocalHelp);
  } else if (lowered.compare(0, kSendPrefix.size(), kSendPrefix) == 0) {
    std::string_view path = trim(line.substr(kSendPrefix.size()));
    if (path.empty()) {
      return expected<InputAction, ErrorCode>::success(InputAction::kUsage);
    }
    sent = send_file(std::string(path));
  } else {
    sent = send_text(line);
  }

  if (!sent) {
    return expected<InputAction, ErrorCode>::error(sent.get_error());
  }
  return expected<InputAction, ErrorCode>::success(action);
}

expected<std::string, ErrorCode> ChatClient::save_received_file(std::string_view filename,
                                                                std::string_view data) const {
  std::string name = safe_basename(filename);
  if (name.empty()) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.download_dir, ec);
  if (ec) {
    TCHAT_LOG_ERROR("Cannot create '" + config_.download_dir + "': " + ec.message());
    return expected<std::string, ErrorCode>::error(ErrorCode::kInternalError);
  }

  std::string save_path = (std::filesystem::path(config_.download_dir) / name).string();
  std::ofstream out(save_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kInternalError);
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!out) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kInternalError);
  }
  return expected<std::string, ErrorCode>::success(std::move(save_path));
}

void ChatClient::disconnect() {
  is_running_.store(false, std::memory_order_release);
  if (conn_) {
    conn_->shutdown();
  }
}

}  // namespace tchat
