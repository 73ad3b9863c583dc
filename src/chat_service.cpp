#include "enginebridge/chat_service.hpp"

#include "enginebridge/completion_format.hpp"
#include "enginebridge/error.hpp"
#include "enginebridge/utils/uuid.hpp"

#include <algorithm>
#include <cctype>

namespace enginebridge {
namespace {

using json = nlohmann::json;

bool is_blank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string trim(const std::string& value) {
  auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
  auto begin = std::find_if(value.begin(), value.end(), not_space);
  auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

json model_entry(const char* id) {
  return json{{"id", id}, {"object", "model"}, {"created", 1234567890}, {"owned_by", "enginelabs"}};
}

}  // namespace

std::string extract_message_content(const json& content) {
  if (content.is_string()) {
    return content.get<std::string>();
  }
  if (!content.is_array()) {
    return {};
  }

  std::string text;
  bool first = true;
  for (const auto& part : content) {
    if (!part.is_object() || part.value("type", "") != "text") {
      continue;
    }
    const auto text_it = part.find("text");
    if (text_it == part.end() || !text_it->is_string() || text_it->get_ref<const std::string&>().empty()) {
      continue;
    }
    if (!first) {
      text += "\n";
    }
    text += text_it->get<std::string>();
    first = false;
  }
  return text;
}

std::string build_transcript_prompt(const std::vector<ChatMessage>& messages) {
  std::string prompt;
  bool first = true;
  for (const auto& message : messages) {
    const std::string content = extract_message_content(message.content);
    if (is_blank(content)) {
      continue;
    }
    if (!first) {
      prompt += "\n";
    }
    prompt += (message.role.empty() ? std::string("unknown") : message.role) + ":\n" + content + "\n";
    first = false;
  }
  if (is_blank(prompt)) {
    throw InvalidRequestError("Message content is empty");
  }
  return prompt;
}

std::string build_followup_prompt(const std::vector<ChatMessage>& messages) {
  auto last_user = std::find_if(messages.rbegin(), messages.rend(), [](const ChatMessage& message) {
    return message.role == "user";
  });
  if (last_user == messages.rend() || last_user->content.is_null()) {
    throw InvalidRequestError("No user message found");
  }
  std::string prompt = extract_message_content(last_user->content);
  if (is_blank(prompt)) {
    throw InvalidRequestError("Message content is empty");
  }
  return prompt;
}

json list_models() {
  return json{{"object", "list"}, {"data", json::array({model_entry("ClaudeSonnet4_5"), model_entry("GPT5")})}};
}

ChatService::ChatService(const ChatBridge& bridge, IdentityProvider& identities, ConversationStore& conversations)
    : bridge_(bridge), identities_(identities), conversations_(conversations) {}

Session ChatService::prepare(const ChatRequest& request) const {
  if (request.messages.empty()) {
    throw InvalidRequestError("messages must not be empty");
  }

  Session session;
  session.model = request.model.empty() ? kDefaultModel : request.model;

  const Identity identity = identities_.acquire(request.credential);
  session.auth_token = identity.auth_token;
  session.identity_token = identity.user_id;

  const auto existing = conversations_.find(request.messages, session.model);
  session.session_id = existing ? *existing : utils::uuid4();
  session.prompt = existing ? build_followup_prompt(request.messages) : build_transcript_prompt(request.messages);
  session.request_id = "chatcmpl-" + utils::uuid4();
  session.forwarded_headers = request.headers;

  bridge_.logger().log(LogLevel::Info,
                       existing ? "reusing conversation" : "starting conversation",
                       {{"session_id", session.session_id},
                        {"model", session.model},
                        {"messages", request.messages.size()}});
  return session;
}

std::unique_ptr<CompletionStream> ChatService::stream(const ChatRequest& request) const {
  Session session = prepare(request);
  const std::string model = session.model;
  const std::string session_id = session.session_id;

  auto stream = bridge_.stream(std::move(session));
  stream->on_complete([this, request, model, session_id](const std::string& content) {
    register_conversation(request, model, session_id, content);
  });
  return stream;
}

json ChatService::complete(const ChatRequest& request) const {
  const Session session = prepare(request);
  const std::string content = bridge_.complete(session);
  register_conversation(request, session.model, session.session_id, content);
  return make_completion_response(session.request_id, session.model, content);
}

void ChatService::register_conversation(const ChatRequest& request,
                                        const std::string& model,
                                        const std::string& session_id,
                                        const std::string& content) const {
  const std::string trimmed = trim(content);
  if (trimmed.empty()) {
    return;
  }

  std::vector<ChatMessage> transcript = request.messages;
  transcript.push_back(ChatMessage{"assistant", trimmed});
  try {
    conversations_.record(transcript, model, session_id);
    bridge_.logger().log(LogLevel::Info, "conversation registered", {{"session_id", session_id}});
  } catch (const std::exception& ex) {
    bridge_.logger().log(LogLevel::Error, "conversation registration failed", {{"session_id", session_id}, {"error", ex.what()}});
  }
}

}  // namespace enginebridge
