#include "enginebridge/stream_translator.hpp"

#include "enginebridge/backend_events.hpp"
#include "enginebridge/error.hpp"

#include <variant>

namespace enginebridge {

StreamTranslator::StreamTranslator(const Logger& logger) : logger_(logger) {}

bool StreamTranslator::consume(const std::string& message, std::vector<Frame>& out) {
  if (terminated_) {
    return true;
  }

  std::optional<BackendEvent> event;
  try {
    event = parse_backend_frame(message);
  } catch (const ProtocolError& ex) {
    logger_.log(LogLevel::Debug, "skipping malformed socket frame", {{"error", ex.what()}});
    return false;
  }
  if (!event) {
    return false;
  }

  if (const auto* update = std::get_if<UpdateEvent>(&*event)) {
    received_any_update_ = true;
    apply_update(update->buffer, out);
    return false;
  }

  const auto& state = std::get<StateEvent>(*event);
  if (state.in_progress) {
    return false;
  }
  if (!received_any_update_) {
    logger_.log(LogLevel::Debug, "ignoring idle state received before any update");
    return false;
  }

  finish(out);
  return true;
}

void StreamTranslator::finish(std::vector<Frame>& out) {
  terminated_ = true;
  if (auto close_marker = framer_.finish()) {
    out.push_back(std::move(*close_marker));
  }
}

void StreamTranslator::apply_update(const std::string& buffer, std::vector<Frame>& out) {
  std::optional<BufferPayload> payload;
  try {
    payload = parse_buffer_payload(buffer);
  } catch (const ProtocolError& ex) {
    logger_.log(LogLevel::Debug, "skipping malformed update buffer", {{"error", ex.what()}});
    return;
  }
  if (!payload || payload->content.empty()) {
    return;
  }

  for (auto& marker : framer_.on_segment(payload->segment_type)) {
    out.push_back(std::move(marker));
  }

  const ReconcileMode before = reconciler_.mode(payload->segment_type);
  std::string delta = reconciler_.reconcile(payload->segment_type, payload->content);
  const ReconcileMode after = reconciler_.mode(payload->segment_type);
  if (before == ReconcileMode::Undetermined && after != ReconcileMode::Undetermined) {
    logger_.log(LogLevel::Debug,
                "buffer update mode detected",
                {{"segment", segment_type_name(payload->segment_type)},
                 {"mode", after == ReconcileMode::Snapshot ? "snapshot" : "delta"}});
  }

  if (!delta.empty()) {
    out.push_back(Frame{std::move(delta), false, false});
  }
}

}  // namespace enginebridge
