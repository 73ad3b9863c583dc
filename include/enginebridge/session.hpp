#pragma once

#include <map>
#include <optional>
#include <string>

namespace enginebridge {

struct Session {
  std::string request_id;
  std::string model;
  /** Backend chat-history id. */
  std::string session_id;
  /** User id placed in the socket URL. */
  std::string identity_token;
  /** Bearer token for the trigger call. */
  std::string auth_token;
  std::string prompt;
  std::optional<std::map<std::string, std::string>> forwarded_headers;
};

}  // namespace enginebridge
