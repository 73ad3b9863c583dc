#include "enginebridge/options.hpp"

#include "enginebridge/utils/env.hpp"

namespace enginebridge {
namespace {

void override_default(std::string& field, const char* default_value, const char* variable) {
  if (field != default_value) {
    return;
  }
  if (auto value = utils::read_env(variable)) {
    if (!value->empty()) {
      field = *value;
    }
  }
}

}  // namespace

BridgeOptions apply_environment(BridgeOptions options) {
  override_default(options.base_url, kDefaultBaseUrl, "ENGINEBRIDGE_BASE_URL");
  override_default(options.socket_base_url, kDefaultSocketBaseUrl, "ENGINEBRIDGE_SOCKET_URL");
  override_default(options.origin, kDefaultOrigin, "ENGINEBRIDGE_ORIGIN");

  if (options.log_level == LogLevel::Off) {
    if (auto level = utils::read_env("ENGINEBRIDGE_LOG")) {
      options.log_level = parse_log_level(*level, LogLevel::Off);
    }
  }

  // Trailing slashes would double up when paths are appended.
  while (!options.base_url.empty() && options.base_url.back() == '/') {
    options.base_url.pop_back();
  }
  while (!options.socket_base_url.empty() && options.socket_base_url.back() == '/') {
    options.socket_base_url.pop_back();
  }
  return options;
}

}  // namespace enginebridge
