/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Wire protocol: typed, length-prefixed frames.
 *
 *   [length: 4B big-endian][type: 1B][payload: length - 1 bytes]
 */

#ifndef TCHAT_PROTOCOL_HPP_
#define TCHAT_PROTOCOL_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace tchat {

// ============================================================================
// Message types
// ============================================================================

enum class MessageType : uint8_t {
  kText = 0x01,
  kFile = 0x02,
  kJoin = 0x03,
  kLeave = 0x04,
  kError = 0x05,
  kCommand = 0x06
};

struct Message {
  MessageType type;  // May hold a tag outside the enumerators; see is_known_type()
  std::string payload;

  std::string_view text() const { return payload; }
};

constexpr size_t kFrameHeaderSize = 4;
constexpr size_t kTypeSize = 1;
constexpr uint32_t kDefaultMaxFrameBytes = 16U * 1024U * 1024U;

// Separator between sender, filename and data in TEXT/FILE payloads
constexpr std::string_view kFieldSeparator = "::";

bool is_known_type(uint8_t tag);
const char* message_type_name(MessageType type);

// ============================================================================
// Frame codec
// ============================================================================

/**
 * @brief Build one complete frame (length prefix included).
 */
std::vector<uint8_t> encode_frame(MessageType type, std::string_view payload);

/**
 * @brief Reads exactly `len` bytes into `buf`.
 *
 * Must return error(kConnectionClosed) when the stream ends before `len`
 * bytes arrive, or error(kSocketError) on transport failure.
 */
using ReadExactFn = function_ref<expected<void, ErrorCode>(uint8_t* buf, size_t len)>;

/**
 * @brief Decode one frame from a blocking byte source.
 *
 * Reads the 4-byte prefix, validates it, then reads exactly the declared body.
 * Never reads past the frame boundary.
 *
 * @param read_exact Byte source
 * @param max_body   Upper bound on (type + payload) length, 0 = unbounded
 * @return Message, or kConnectionClosed (stream ended), kMalformedHeader
 *         (zero-length body), kFrameTooLarge (checked before allocation),
 *         kSocketError (transport failure). Callers treat all four the same:
 *         drop the connection.
 */
expected<Message, ErrorCode> decode_frame(ReadExactFn read_exact, uint32_t max_body = kDefaultMaxFrameBytes);

/**
 * @brief Decode one frame from an in-memory buffer.
 *
 * @param consumed Set to the frame size on success, untouched otherwise
 */
expected<Message, ErrorCode> decode_frame(std::string_view buffer, size_t& consumed,
                                          uint32_t max_body = kDefaultMaxFrameBytes);

// ============================================================================
// Payload helpers
// ============================================================================

// "<sender>::<payload>"
std::string make_sender_payload(std::string_view sender, std::string_view payload);

// "<filename>::<data>" (client -> server FILE)
std::string make_file_payload(std::string_view filename, std::string_view data);

struct TextPayload {
  std::string_view sender;
  std::string_view text;
};

struct FilePayload {
  std::string_view sender;  // Empty for client -> server payloads
  std::string_view filename;
  std::string_view data;
};

// Split a broadcast TEXT payload at the first "::"
optional<TextPayload> split_text_payload(std::string_view payload);

// Split a broadcast FILE payload "<sender>::<filename>::<data>" on the first
// two separators; data is everything after the second one, unescaped.
optional<FilePayload> split_file_payload(std::string_view payload);

// Split a client FILE payload "<filename>::<data>"; the filename must be non-empty.
optional<FilePayload> parse_client_file_payload(std::string_view payload);

}  // namespace tchat

#endif  // TCHAT_PROTOCOL_HPP_
