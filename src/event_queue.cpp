#include "enginebridge/event_queue.hpp"

#include "enginebridge/error.hpp"

#include <utility>

namespace enginebridge {

void SocketEventQueue::push_message(std::string data) {
  push(SocketEvent{SocketEvent::Type::Message, std::move(data)});
}

void SocketEventQueue::push_close() {
  push(SocketEvent{SocketEvent::Type::Close, {}});
}

void SocketEventQueue::push_error(std::string description) {
  push(SocketEvent{SocketEvent::Type::Error, std::move(description)});
}

void SocketEventQueue::push(SocketEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_queued_) {
      return;
    }
    terminal_queued_ = event.terminal();
    queue_.push_back(std::move(event));
  }
  ready_.notify_one();
}

std::optional<SocketEvent> SocketEventQueue::next() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (finished_) {
    return std::nullopt;
  }
  if (consumer_waiting_) {
    throw BridgeError("SocketEventQueue supports a single consumer");
  }
  consumer_waiting_ = true;
  ready_.wait(lock, [this] { return !queue_.empty(); });
  consumer_waiting_ = false;

  SocketEvent event = std::move(queue_.front());
  queue_.pop_front();
  if (event.terminal()) {
    finished_ = true;
    queue_.clear();
  }
  return event;
}

SocketHandlers SocketEventQueue::handlers() {
  SocketHandlers handlers;
  handlers.on_message = [this](std::string data) { push_message(std::move(data)); };
  handlers.on_close = [this] { push_close(); };
  handlers.on_error = [this](std::string description) { push_error(std::move(description)); };
  return handlers;
}

}  // namespace enginebridge
