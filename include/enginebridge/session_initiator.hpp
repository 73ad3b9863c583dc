#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "enginebridge/http_client.hpp"
#include "enginebridge/logging.hpp"
#include "enginebridge/options.hpp"
#include "enginebridge/session.hpp"
#include "enginebridge/websocket.hpp"

namespace enginebridge {

class SessionInitiator {
public:
  SessionInitiator(const BridgeOptions& options,
                   HttpClient& http_client,
                   WebSocketConnector& connector,
                   const Logger& logger);

  std::string socket_url(const Session& session) const;

  /** Opens the buffer stream socket. Throws ConnectionError. */
  std::unique_ptr<WebSocketConnection> open(const Session& session, SocketHandlers handlers) const;

  /** Headers for the trigger call; mandatory headers override forwarded ones. */
  std::map<std::string, std::string> trigger_headers(const Session& session) const;

  /** Asks the backend to start producing output. Throws UpstreamTriggerError. */
  void trigger(const Session& session) const;

  /**
   * Like trigger(), but logs a failure and returns its description instead
   * of throwing.
   */
  std::optional<std::string> trigger_and_log(const Session& session) const;

private:
  const BridgeOptions& options_;
  HttpClient& http_client_;
  WebSocketConnector& connector_;
  const Logger& logger_;
};

}  // namespace enginebridge
