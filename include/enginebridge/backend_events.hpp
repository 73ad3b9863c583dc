#pragma once

#include <optional>
#include <string>
#include <variant>

namespace enginebridge {

enum class SegmentType { Chat, Thinking };

const char* segment_type_name(SegmentType type);

struct UpdateEvent {
  std::string buffer;
};

struct StateEvent {
  bool in_progress = false;
};

using BackendEvent = std::variant<UpdateEvent, StateEvent>;

struct BufferPayload {
  SegmentType segment_type = SegmentType::Chat;
  std::string content;
};

/**
 * Decodes one socket text frame. Returns std::nullopt for frame types the
 * pipeline does not act on; throws ProtocolError on malformed JSON.
 */
std::optional<BackendEvent> parse_backend_frame(const std::string& frame);

/**
 * Decodes the JSON string carried by UpdateEvent::buffer. Returns
 * std::nullopt for buffer types other than "chat" and "thinking"; throws
 * ProtocolError on malformed JSON.
 */
std::optional<BufferPayload> parse_buffer_payload(const std::string& buffer);

}  // namespace enginebridge
