#include "enginebridge/completion_stream.hpp"

#include "enginebridge/completion_format.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace enginebridge {

CompletionStream::CompletionStream(Session session, const SessionInitiator& initiator, const Logger& logger)
    : session_(std::move(session)), initiator_(initiator), logger_(logger), translator_(logger) {}

CompletionStream::~CompletionStream() {
  if (connection_) {
    connection_->close();
  }
}

std::optional<std::string> CompletionStream::next() {
  while (pending_.empty() && phase_ != Phase::Done) {
    advance();
  }
  if (pending_.empty()) {
    return std::nullopt;
  }
  std::string line = std::move(pending_.front());
  pending_.pop_front();
  return line;
}

void CompletionStream::advance() {
  switch (phase_) {
    case Phase::Priming:
      pending_.push_back(encode_chunk(session_.request_id, session_.model, ""));
      phase_ = Phase::Opening;
      break;
    case Phase::Opening:
      open_session();
      break;
    case Phase::Streaming:
      pump();
      break;
    case Phase::Finishing:
      finish_stream();
      break;
    case Phase::Done:
      break;
  }
}

void CompletionStream::open_session() {
  try {
    connection_ = initiator_.open(session_, events_.handlers());
    const SessionInitiator& initiator = initiator_;
    trigger_ = std::async(std::launch::async, [&initiator, session = session_] {
      (void)initiator.trigger_and_log(session);
    });
    phase_ = Phase::Streaming;
  } catch (const std::exception& ex) {
    logger_.log(LogLevel::Error, "stream failed to start", {{"session_id", session_.session_id}, {"error", ex.what()}});
    fail(ex.what());
  }
}

void CompletionStream::pump() {
  try {
    auto event = events_.next();
    std::vector<Frame> frames;
    if (!event) {
      translator_.finish(frames);
      phase_ = Phase::Finishing;
    } else if (event->type == SocketEvent::Type::Message) {
      if (translator_.consume(event->data, frames)) {
        phase_ = Phase::Finishing;
      }
    } else if (event->type == SocketEvent::Type::Close) {
      logger_.log(LogLevel::Info, "websocket closed before completion", {{"session_id", session_.session_id}});
      translator_.finish(frames);
      phase_ = Phase::Finishing;
    } else {
      logger_.log(LogLevel::Error, "websocket error", {{"session_id", session_.session_id}, {"error", event->data}});
      translator_.finish(frames);
      phase_ = Phase::Finishing;
    }
    for (const auto& frame : frames) {
      emit(frame);
    }
  } catch (const std::exception& ex) {
    logger_.log(LogLevel::Error, "stream processing failed", {{"session_id", session_.session_id}, {"error", ex.what()}});
    fail(ex.what());
  }
}

void CompletionStream::fail(const std::string& description) {
  std::vector<Frame> frames;
  translator_.finish(frames);
  for (const auto& frame : frames) {
    emit(frame);
  }
  pending_.push_back(encode_chunk(session_.request_id, session_.model, "Error: " + description));
  finish_stream();
}

void CompletionStream::emit(const Frame& frame) {
  if (frame.is_finish) {
    pending_.push_back(encode_chunk(session_.request_id, session_.model, "", std::string("stop")));
    return;
  }
  if (frame.text.empty()) {
    return;
  }
  content_ += frame.text;
  pending_.push_back(encode_chunk(session_.request_id, session_.model, frame.text));
}

void CompletionStream::finish_stream() {
  if (connection_) {
    connection_->close();
  }
  emit(Frame{"", false, true});
  pending_.push_back(kStreamDoneSentinel);
  phase_ = Phase::Done;

  if (on_complete_) {
    try {
      on_complete_(content_);
    } catch (const std::exception& ex) {
      logger_.log(LogLevel::Error, "stream completion handler failed", {{"session_id", session_.session_id}, {"error", ex.what()}});
    }
  }
}

}  // namespace enginebridge
