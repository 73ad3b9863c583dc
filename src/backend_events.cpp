#include "enginebridge/backend_events.hpp"

#include "enginebridge/error.hpp"

#include <nlohmann/json.hpp>

namespace enginebridge {
namespace {

using json = nlohmann::json;

json parse_object(const std::string& text, const char* what) {
  json payload;
  try {
    payload = json::parse(text);
  } catch (const json::exception& ex) {
    throw ProtocolError(std::string("Failed to parse ") + what + ": " + ex.what());
  }
  if (!payload.is_object()) {
    throw ProtocolError(std::string("Expected a JSON object in ") + what);
  }
  return payload;
}

bool truthy(const json& value) {
  if (value.is_boolean()) return value.get<bool>();
  if (value.is_number()) return value.get<double>() != 0.0;
  if (value.is_string()) return !value.get_ref<const std::string&>().empty();
  return !value.is_null();
}

}  // namespace

const char* segment_type_name(SegmentType type) {
  return type == SegmentType::Thinking ? "thinking" : "chat";
}

std::optional<BackendEvent> parse_backend_frame(const std::string& frame) {
  const json payload = parse_object(frame, "socket frame");
  const auto type_it = payload.find("type");
  if (type_it == payload.end() || !type_it->is_string()) {
    return std::nullopt;
  }
  const auto& type = type_it->get_ref<const std::string&>();

  if (type == "update") {
    UpdateEvent update;
    const auto buffer_it = payload.find("buffer");
    if (buffer_it != payload.end() && buffer_it->is_string() && !buffer_it->get_ref<const std::string&>().empty()) {
      update.buffer = buffer_it->get<std::string>();
    } else {
      update.buffer = "{}";
    }
    return update;
  }

  if (type == "state") {
    StateEvent state;
    const auto state_it = payload.find("state");
    if (state_it != payload.end() && state_it->is_object()) {
      const auto progress_it = state_it->find("inProgress");
      if (progress_it != state_it->end()) {
        state.in_progress = truthy(*progress_it);
      }
    }
    return state;
  }

  return std::nullopt;
}

std::optional<BufferPayload> parse_buffer_payload(const std::string& buffer) {
  const json payload = parse_object(buffer, "update buffer");

  BufferPayload result;
  const std::string type = payload.contains("type") && payload["type"].is_string() ? payload["type"].get<std::string>() : "";
  if (type == "chat") {
    result.segment_type = SegmentType::Chat;
  } else if (type == "thinking") {
    result.segment_type = SegmentType::Thinking;
  } else {
    return std::nullopt;
  }

  if (payload.contains("chat") && payload["chat"].is_object()) {
    const auto& chat = payload["chat"];
    if (chat.contains("content") && chat["content"].is_string()) {
      result.content = chat["content"].get<std::string>();
    }
  }
  return result;
}

}  // namespace enginebridge
