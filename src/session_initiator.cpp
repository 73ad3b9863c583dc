#include "enginebridge/session_initiator.hpp"

#include "enginebridge/error.hpp"
#include "enginebridge/header_filter.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace enginebridge {
namespace {

using json = nlohmann::json;

constexpr const char* kTriggerPath = "/engine-agent/chat";
constexpr std::size_t kBodyExcerptLimit = 200;

// Framing and encoding belong to the transport, never to the caller's request.
constexpr std::array<std::string_view, 3> kTransportHeaders = {"Content-Length", "Transfer-Encoding", "Accept-Encoding"};

bool iequals(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
         });
}

void erase_header(std::map<std::string, std::string>& headers, std::string_view name) {
  for (auto it = headers.begin(); it != headers.end();) {
    if (iequals(it->first, name)) {
      it = headers.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace

SessionInitiator::SessionInitiator(const BridgeOptions& options,
                                   HttpClient& http_client,
                                   WebSocketConnector& connector,
                                   const Logger& logger)
    : options_(options), http_client_(http_client), connector_(connector), logger_(logger) {}

std::string SessionInitiator::socket_url(const Session& session) const {
  return options_.socket_base_url + "/engine-agent/chat-histories/" + session.session_id +
         "/buffer/stream?token=" + session.identity_token;
}

std::unique_ptr<WebSocketConnection> SessionInitiator::open(const Session& session, SocketHandlers handlers) const {
  auto connection = connector_.connect(socket_url(session), {}, std::move(handlers));
  logger_.log(LogLevel::Info, "websocket connected", {{"session_id", session.session_id}, {"request_id", session.request_id}});
  return connection;
}

std::map<std::string, std::string> SessionInitiator::trigger_headers(const Session& session) const {
  std::map<std::string, std::string> headers;
  if (session.forwarded_headers) {
    headers = filter_forwarded_headers(*session.forwarded_headers, logger_);
    for (const auto name : kTransportHeaders) {
      erase_header(headers, name);
    }
  }

  const std::array<std::pair<std::string, std::string>, 4> mandatory = {{
      {"Authorization", "Bearer " + session.auth_token},
      {"Content-Type", "application/json"},
      {"Origin", options_.origin},
      {"Referer", options_.origin + "/" + session.session_id},
  }};
  for (const auto& [name, value] : mandatory) {
    erase_header(headers, name);
    headers[name] = value;
  }
  return headers;
}

void SessionInitiator::trigger(const Session& session) const {
  const json payload = {
      {"prompt", session.prompt},
      {"chatHistoryId", session.session_id},
      {"adapterName", session.model},
  };

  HttpRequest request;
  request.method = "POST";
  request.url = options_.base_url + kTriggerPath;
  request.headers = trigger_headers(session);
  request.body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
  request.timeout = options_.trigger_timeout;

  HttpResponse response;
  try {
    response = http_client_.request(request);
  } catch (const BridgeError& ex) {
    throw UpstreamTriggerError(std::string("Trigger call failed: ") + ex.what(), 0, "");
  }

  logger_.log(LogLevel::Debug, "trigger call completed", {{"status", response.status_code}, {"session_id", session.session_id}});
  if (response.status_code < 200 || response.status_code >= 300) {
    std::string excerpt = response.body.substr(0, kBodyExcerptLimit);
    throw UpstreamTriggerError("Trigger call failed with status " + std::to_string(response.status_code) + ": " + excerpt,
                               response.status_code,
                               excerpt);
  }
}

std::optional<std::string> SessionInitiator::trigger_and_log(const Session& session) const {
  try {
    trigger(session);
    return std::nullopt;
  } catch (const UpstreamTriggerError& ex) {
    const json details = {{"session_id", session.session_id}, {"status", ex.status_code()}, {"body", ex.body_excerpt()}};
    logger_.log(ex.status_code() == 0 ? LogLevel::Error : LogLevel::Warn, "trigger call failed", details);
    return std::string(ex.what());
  }
}

}  // namespace enginebridge
