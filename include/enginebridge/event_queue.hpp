#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "enginebridge/websocket.hpp"

namespace enginebridge {

struct SocketEvent {
  enum class Type { Message, Close, Error };

  Type type = Type::Message;
  std::string data;

  [[nodiscard]] bool terminal() const { return type != Type::Message; }
};

/**
 * Turns socket callbacks into a blocking pull sequence. Producers may push
 * from any thread; exactly one consumer may call next() at a time.
 *
 * Every message is yielded in arrival order, followed by exactly one close or
 * error event. Anything pushed after the first terminal event is dropped.
 */
class SocketEventQueue {
public:
  void push_message(std::string data);
  void push_close();
  void push_error(std::string description);

  /**
   * Blocks until an event is available. Returns std::nullopt once the
   * terminal event has been consumed.
   */
  std::optional<SocketEvent> next();

  /** Handlers forwarding into this queue. The queue must outlive the connection using them. */
  SocketHandlers handlers();

private:
  void push(SocketEvent event);

  std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<SocketEvent> queue_;
  bool terminal_queued_ = false;
  bool finished_ = false;
  bool consumer_waiting_ = false;
};

}  // namespace enginebridge
