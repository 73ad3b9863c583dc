#pragma once

#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "enginebridge/event_queue.hpp"
#include "enginebridge/frame.hpp"
#include "enginebridge/logging.hpp"
#include "enginebridge/session.hpp"
#include "enginebridge/session_initiator.hpp"
#include "enginebridge/stream_translator.hpp"
#include "enginebridge/websocket.hpp"

namespace enginebridge {

/**
 * Lazy, single-pass sequence of encoded server-sent event lines for one
 * session. The first call to next() yields the priming chunk before any
 * backend I/O; the sequence always ends with a finish chunk and the
 * "[DONE]" sentinel, including after failures.
 *
 * The trigger call runs concurrently with socket consumption. The stream
 * must not outlive the ChatBridge that created it. Destroying it closes the
 * socket but then waits for an in-flight trigger call, which can take up to
 * BridgeOptions::trigger_timeout.
 */
class CompletionStream {
public:
  using CompletionCallback = std::function<void(const std::string& content)>;

  CompletionStream(Session session, const SessionInitiator& initiator, const Logger& logger);
  ~CompletionStream();

  CompletionStream(const CompletionStream&) = delete;
  CompletionStream& operator=(const CompletionStream&) = delete;

  /** Next encoded line, or std::nullopt once the sentinel has been returned. */
  std::optional<std::string> next();

  /** Invoked once with content() after the sentinel has been queued. */
  void on_complete(CompletionCallback callback) { on_complete_ = std::move(callback); }

  /** Text of all content and marker frames emitted so far. */
  const std::string& content() const { return content_; }
  const Session& session() const { return session_; }
  [[nodiscard]] bool done() const { return phase_ == Phase::Done && pending_.empty(); }

private:
  enum class Phase { Priming, Opening, Streaming, Finishing, Done };

  void advance();
  void open_session();
  void pump();
  void fail(const std::string& description);
  void emit(const Frame& frame);
  void finish_stream();

  Session session_;
  const SessionInitiator& initiator_;
  const Logger& logger_;
  SocketEventQueue events_;
  std::unique_ptr<WebSocketConnection> connection_;
  std::future<void> trigger_;
  StreamTranslator translator_;
  std::deque<std::string> pending_;
  std::string content_;
  Phase phase_ = Phase::Priming;
  CompletionCallback on_complete_;
};

}  // namespace enginebridge
