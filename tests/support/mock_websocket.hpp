#pragma once

#include "enginebridge/error.hpp"
#include "enginebridge/websocket.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace enginebridge::testing {

/**
 * Scripted socket: delivers every queued message as soon as the connection
 * opens, then ends the way the script says. A connection left open reports a
 * close event when close() is called, like a real socket.
 */
class MockWebSocketConnector final : public WebSocketConnector {
public:
  enum class Ending { Close, Error, Open };

  class Connection final : public WebSocketConnection {
  public:
    Connection(MockWebSocketConnector& owner, SocketHandlers handlers)
        : owner_(owner), handlers_(std::move(handlers)) {}

    void close() override {
      owner_.record_close();
      if (!ended_) {
        ended_ = true;
        handlers_.on_close();
      }
    }

    void deliver(const std::vector<std::string>& messages, Ending ending, const std::string& error) {
      for (const auto& message : messages) {
        handlers_.on_message(message);
      }
      if (ending == Ending::Close) {
        ended_ = true;
        handlers_.on_close();
      } else if (ending == Ending::Error) {
        ended_ = true;
        handlers_.on_error(error);
      }
    }

  private:
    MockWebSocketConnector& owner_;
    SocketHandlers handlers_;
    bool ended_ = false;
  };

  std::unique_ptr<WebSocketConnection> connect(const std::string& url,
                                               const std::map<std::string, std::string>& headers,
                                               SocketHandlers handlers) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      urls_.push_back(url);
      last_headers_ = headers;
      if (connect_error_) {
        throw ConnectionError(*connect_error_);
      }
    }
    auto connection = std::make_unique<Connection>(*this, std::move(handlers));
    connection->deliver(messages_, ending_, error_);
    return connection;
  }

  void push_message(std::string message) { messages_.push_back(std::move(message)); }
  void end_with(Ending ending, std::string error = {}) {
    ending_ = ending;
    error_ = std::move(error);
  }
  void fail_connect(std::string message) { connect_error_ = std::move(message); }

  [[nodiscard]] std::vector<std::string> urls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return urls_;
  }

  [[nodiscard]] std::map<std::string, std::string> last_headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_headers_;
  }

  [[nodiscard]] int close_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_calls_;
  }

private:
  void record_close() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++close_calls_;
  }

  std::vector<std::string> messages_;
  Ending ending_ = Ending::Open;
  std::string error_;
  std::optional<std::string> connect_error_;
  std::vector<std::string> urls_;
  std::map<std::string, std::string> last_headers_;
  int close_calls_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace enginebridge::testing
