#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "enginebridge/chat_bridge.hpp"
#include "enginebridge/completion_stream.hpp"
#include "enginebridge/logging.hpp"
#include "enginebridge/session.hpp"

namespace enginebridge {

inline constexpr const char* kDefaultModel = "ClaudeSonnet4_5";

struct ChatMessage {
  std::string role;
  /** A string, or an array of content parts. */
  nlohmann::json content;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream = false;
  /** Raw credential handed to the IdentityProvider. */
  std::string credential;
  std::map<std::string, std::string> headers;
};

struct Identity {
  std::string auth_token;
  std::string user_id;
};

class IdentityProvider {
public:
  virtual ~IdentityProvider() = default;

  /** Throws AuthenticationError when the credential is rejected. */
  virtual Identity acquire(const std::string& credential) = 0;
};

class ConversationStore {
public:
  virtual ~ConversationStore() = default;

  virtual std::optional<std::string> find(const std::vector<ChatMessage>& messages, const std::string& model) = 0;
  virtual void record(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      const std::string& session_id) = 0;
};

/** Text of a message content value; only "text" parts of an array count. */
std::string extract_message_content(const nlohmann::json& content);

/** Prompt for a fresh backend session: the whole transcript. */
std::string build_transcript_prompt(const std::vector<ChatMessage>& messages);

/** Prompt for a reused backend session: the last user message. */
std::string build_followup_prompt(const std::vector<ChatMessage>& messages);

nlohmann::json list_models();

/**
 * Request-level flow around ChatBridge: identity, session reuse, prompt
 * assembly and conversation registration.
 */
class ChatService {
public:
  ChatService(const ChatBridge& bridge, IdentityProvider& identities, ConversationStore& conversations);

  /** Resolves identity, session id and prompt. Throws InvalidRequestError or AuthenticationError. */
  Session prepare(const ChatRequest& request) const;

  std::unique_ptr<CompletionStream> stream(const ChatRequest& request) const;

  /** Aggregate chat.completion object. */
  nlohmann::json complete(const ChatRequest& request) const;

private:
  void register_conversation(const ChatRequest& request,
                             const std::string& model,
                             const std::string& session_id,
                             const std::string& content) const;

  const ChatBridge& bridge_;
  IdentityProvider& identities_;
  ConversationStore& conversations_;
};

}  // namespace enginebridge
