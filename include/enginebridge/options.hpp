#pragma once

#include <chrono>
#include <string>

#include "enginebridge/logging.hpp"

namespace enginebridge {

inline constexpr const char* kDefaultBaseUrl = "https://api.enginelabs.ai";
inline constexpr const char* kDefaultSocketBaseUrl = "wss://api.enginelabs.ai";
inline constexpr const char* kDefaultOrigin = "https://cto.new";

struct BridgeOptions {
  /** Base of the trigger endpoint. */
  std::string base_url = kDefaultBaseUrl;
  /** Base of the buffer stream socket endpoint. */
  std::string socket_base_url = kDefaultSocketBaseUrl;
  /** Sent as Origin, and as the Referer prefix, on the trigger call. */
  std::string origin = kDefaultOrigin;
  std::chrono::milliseconds trigger_timeout{60000};
  LogLevel log_level = LogLevel::Off;
  /** Invoked from the trigger task as well as the caller's thread, one record at a time. */
  LoggerCallback logger;
};

/**
 * Applies ENGINEBRIDGE_BASE_URL, ENGINEBRIDGE_SOCKET_URL, ENGINEBRIDGE_ORIGIN
 * to fields still holding their defaults, and ENGINEBRIDGE_LOG when the log
 * level is Off.
 */
BridgeOptions apply_environment(BridgeOptions options);

}  // namespace enginebridge
