#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace enginebridge {

/**
 * Callbacks a connection invokes from its reader thread. After on_close or
 * on_error no further callback is made.
 */
struct SocketHandlers {
  std::function<void(std::string)> on_message;
  std::function<void()> on_close;
  std::function<void(std::string)> on_error;
};

class WebSocketConnection {
public:
  virtual ~WebSocketConnection() = default;

  /** Requests a close. Safe to call more than once and from any thread. */
  virtual void close() = 0;
};

class WebSocketConnector {
public:
  virtual ~WebSocketConnector() = default;

  /**
   * Opens a connection and returns once it is open. Throws ConnectionError
   * if the socket fails before that point.
   */
  virtual std::unique_ptr<WebSocketConnection> connect(const std::string& url,
                                                       const std::map<std::string, std::string>& headers,
                                                       SocketHandlers handlers) = 0;
};

std::unique_ptr<WebSocketConnector> make_default_websocket_connector();

}  // namespace enginebridge
