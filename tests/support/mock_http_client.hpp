#pragma once

#include "enginebridge/error.hpp"
#include "enginebridge/http_client.hpp"

#include <mutex>
#include <optional>
#include <queue>
#include <variant>
#include <vector>

namespace enginebridge::testing {

/**
 * In-memory HttpClient that replays queued responses. Requests may arrive
 * from the stream's trigger task, so all access is locked.
 */
class MockHttpClient final : public HttpClient {
public:
  struct EnqueuedError {
    std::string message;
  };

  using Enqueued = std::variant<HttpResponse, EnqueuedError>;

  HttpResponse request(const HttpRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (responses_.empty()) {
      throw BridgeError("MockHttpClient queue underflow");
    }

    auto next = std::move(responses_.front());
    responses_.pop();
    if (auto* error = std::get_if<EnqueuedError>(&next)) {
      throw BridgeError(error->message);
    }
    return std::get<HttpResponse>(next);
  }

  void enqueue_response(HttpResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(std::move(response));
  }

  void enqueue_error(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(EnqueuedError{std::move(message)});
  }

  [[nodiscard]] std::optional<HttpRequest> last_request() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.empty()) {
      return std::nullopt;
    }
    return requests_.back();
  }

  [[nodiscard]] std::size_t request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

private:
  std::queue<Enqueued> responses_;
  std::vector<HttpRequest> requests_;
  mutable std::mutex mutex_;
};

}  // namespace enginebridge::testing
