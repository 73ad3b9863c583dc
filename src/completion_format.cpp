#include "enginebridge/completion_format.hpp"

#include <chrono>

namespace enginebridge {

using json = nlohmann::json;

std::int64_t unix_timestamp() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

json make_chunk(const std::string& request_id,
                const std::string& model,
                const std::string& content,
                const std::optional<std::string>& finish_reason,
                std::optional<std::int64_t> created) {
  json delta = json::object();
  if (!content.empty()) {
    delta["content"] = content;
  }

  json choice = {
      {"index", 0},
      {"delta", std::move(delta)},
      {"finish_reason", finish_reason ? json(*finish_reason) : json(nullptr)},
      {"logprobs", nullptr},
  };

  return json{
      {"id", request_id},
      {"object", "chat.completion.chunk"},
      {"created", created.value_or(unix_timestamp())},
      {"model", model},
      {"choices", json::array({std::move(choice)})},
  };
}

std::string encode_chunk(const std::string& request_id,
                         const std::string& model,
                         const std::string& content,
                         const std::optional<std::string>& finish_reason) {
  return "data: " + make_chunk(request_id, model, content, finish_reason).dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

json make_completion_response(const std::string& request_id,
                              const std::string& model,
                              const std::string& content,
                              std::optional<std::int64_t> created) {
  json message = {{"role", "assistant"}, {"content", content}};
  json choice = {
      {"index", 0},
      {"message", std::move(message)},
      {"finish_reason", "stop"},
      {"logprobs", nullptr},
  };

  return json{
      {"id", request_id},
      {"object", "chat.completion"},
      {"created", created.value_or(unix_timestamp())},
      {"model", model},
      {"choices", json::array({std::move(choice)})},
      {"usage", {{"prompt_tokens", 0}, {"completion_tokens", 0}, {"total_tokens", 0}}},
  };
}

}  // namespace enginebridge
