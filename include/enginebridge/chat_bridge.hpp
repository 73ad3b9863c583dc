#pragma once

#include <future>
#include <memory>
#include <string>

#include "enginebridge/completion_stream.hpp"
#include "enginebridge/http_client.hpp"
#include "enginebridge/logging.hpp"
#include "enginebridge/options.hpp"
#include "enginebridge/session.hpp"
#include "enginebridge/session_initiator.hpp"
#include "enginebridge/websocket.hpp"

namespace enginebridge {

class ChatBridge {
public:
  explicit ChatBridge(BridgeOptions options,
                      std::unique_ptr<HttpClient> http_client = nullptr,
                      std::unique_ptr<WebSocketConnector> connector = nullptr);

  ChatBridge(const ChatBridge&) = delete;
  ChatBridge& operator=(const ChatBridge&) = delete;

  const BridgeOptions& options() const { return options_; }
  const Logger& logger() const { return logger_; }

  /** Event-stream rendition of the session. Never throws once constructed. */
  std::unique_ptr<CompletionStream> stream(Session session) const;

  /**
   * Aggregated answer text. The trigger call is awaited before the socket is
   * read. Throws ConnectionError when the socket cannot be opened and
   * UnhandledPipelineError when it errors before the terminal signal.
   */
  std::string complete(const Session& session) const;

  std::future<std::string> complete_async(Session session) const;

private:
  BridgeOptions options_;
  Logger logger_;
  std::unique_ptr<HttpClient> http_client_;
  std::unique_ptr<WebSocketConnector> connector_;
  SessionInitiator initiator_;
};

}  // namespace enginebridge
