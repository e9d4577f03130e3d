/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "tchat/protocol.hpp"

#include <cstring>

namespace tchat {

namespace {

void put_u32_be(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[3] = static_cast<uint8_t>(v & 0xFF);
}

uint32_t get_u32_be(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

// Validate a decoded length prefix
ErrorCode check_body_length(uint32_t body_len, uint32_t max_body) {
  if (body_len < kTypeSize) {
    return ErrorCode::kMalformedHeader;
  }
  if (max_body != 0 && body_len > max_body) {
    return ErrorCode::kFrameTooLarge;
  }
  return ErrorCode::kOk;
}

Message make_message(const uint8_t* body, size_t body_len) {
  Message msg;
  msg.type = static_cast<MessageType>(body[0]);
  msg.payload.assign(reinterpret_cast<const char*>(body) + kTypeSize, body_len - kTypeSize);
  return msg;
}

}  // namespace

bool is_known_type(uint8_t tag) {
  return tag >= static_cast<uint8_t>(MessageType::kText) && tag <= static_cast<uint8_t>(MessageType::kCommand);
}

const char* message_type_name(MessageType type) {
  switch (type) {
    case MessageType::kText:
      return "TEXT";
    case MessageType::kFile:
      return "FILE";
    case MessageType::kJoin:
      return "JOIN";
    case MessageType::kLeave:
      return "LEAVE";
    case MessageType::kError:
      return "ERROR";
    case MessageType::kCommand:
      return "COMMAND";
  }
  return "UNKNOWN";
}

// ============================================================================
// Frame codec
// ============================================================================

std::vector<uint8_t> encode_frame(MessageType type, std::string_view payload) {
  const size_t body_len = kTypeSize + payload.size();
  std::vector<uint8_t> frame(kFrameHeaderSize + body_len);
  put_u32_be(frame.data(), static_cast<uint32_t>(body_len));
  frame[kFrameHeaderSize] = static_cast<uint8_t>(type);
  if (!payload.empty()) {
    std::memcpy(frame.data() + kFrameHeaderSize + kTypeSize, payload.data(), payload.size());
  }
  return frame;
}

expected<Message, ErrorCode> decode_frame(ReadExactFn read_exact, uint32_t max_body) {
  uint8_t header[kFrameHeaderSize];
  auto header_result = read_exact(header, sizeof(header));
  if (!header_result) {
    return expected<Message, ErrorCode>::error(header_result.get_error());
  }

  const uint32_t body_len = get_u32_be(header);
  ErrorCode check = check_body_length(body_len, max_body);
  if (check != ErrorCode::kOk) {
    return expected<Message, ErrorCode>::error(check);
  }

  std::vector<uint8_t> body(body_len);
  auto body_result = read_exact(body.data(), body.size());
  if (!body_result) {
    return expected<Message, ErrorCode>::error(body_result.get_error());
  }

  return expected<Message, ErrorCode>::success(make_message(body.data(), body.size()));
}

expected<Message, ErrorCode> decode_frame(std::string_view buffer, size_t& consumed, uint32_t max_body) {
  if (buffer.size() < kFrameHeaderSize) {
    return expected<Message, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  const auto* p = reinterpret_cast<const uint8_t*>(buffer.data());
  const uint32_t body_len = get_u32_be(p);
  ErrorCode check = check_body_length(body_len, max_body);
  if (check != ErrorCode::kOk) {
    return expected<Message, ErrorCode>::error(check);
  }
  if (buffer.size() - kFrameHeaderSize < body_len) {
    return expected<Message, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  consumed = kFrameHeaderSize + body_len;
  return expected<Message, ErrorCode>::success(make_message(p + kFrameHeaderSize, body_len));
}

// ============================================================================
// Payload helpers
// ============================================================================

std::string make_sender_payload(std::string_view sender, std::string_view payload) {
  std::string out;
  out.reserve(sender.size() + kFieldSeparator.size() + payload.size());
  out.append(sender);
  out.append(kFieldSeparator);
  out.append(payload);
  return out;
}

std::string make_file_payload(std::string_view filename, std::string_view data) {
  return make_sender_payload(filename, data);
}

optional<TextPayload> split_text_payload(std::string_view payload) {
  size_t sep = payload.find(kFieldSeparator);
  if (sep == std::string_view::npos) {
    return {};
  }
  return TextPayload{payload.substr(0, sep), payload.substr(sep + kFieldSeparator.size())};
}

optional<FilePayload> split_file_payload(std::string_view payload) {
  size_t first = payload.find(kFieldSeparator);
  if (first == std::string_view::npos) {
    return {};
  }
  size_t name_start = first + kFieldSeparator.size();
  size_t second = payload.find(kFieldSeparator, name_start);
  if (second == std::string_view::npos) {
    return {};
  }
  return FilePayload{payload.substr(0, first), payload.substr(name_start, second - name_start),
                     payload.substr(second + kFieldSeparator.size())};
}

optional<FilePayload> parse_client_file_payload(std::string_view payload) {
  size_t sep = payload.find(kFieldSeparator);
  if (sep == std::string_view::npos || sep == 0) {
    return {};
  }
  return FilePayload{std::string_view{}, payload.substr(0, sep), payload.substr(sep + kFieldSeparator.size())};
}

}  // namespace tchat
