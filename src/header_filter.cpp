#include "enginebridge/header_filter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <iterator>
#include <set>
#include <string_view>

namespace enginebridge {
namespace {

const std::set<std::string, std::less<>> kAllowedHeaderNames = {
    // OpenAI protocol headers
    "authorization",
    "content-type",
    "accept",
    "openai-organization",
    "openai-project",
    "idempotency-key",
    "openai-beta",
    "x-request-id",
    // HTTP metadata
    "user-agent",
    "accept-encoding",
    "accept-language",
    "content-length",
};

constexpr std::array<std::string_view, 2> kAllowedHeaderPrefixes = {"openai-", "x-openai-"};

std::string to_lower(const std::string& value) {
  std::string lowered;
  lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

}  // namespace

bool is_allowed_header(const std::string& name) {
  const std::string lowered = to_lower(name);
  if (kAllowedHeaderNames.count(lowered) > 0) {
    return true;
  }
  return std::any_of(kAllowedHeaderPrefixes.begin(), kAllowedHeaderPrefixes.end(), [&](std::string_view prefix) {
    return lowered.compare(0, prefix.size(), prefix) == 0;
  });
}

std::map<std::string, std::string> filter_forwarded_headers(const std::map<std::string, std::string>& headers,
                                                            const Logger& logger) {
  std::map<std::string, std::string> filtered;
  std::string dropped;

  for (const auto& [name, value] : headers) {
    if (is_allowed_header(name)) {
      filtered[name] = value;
      continue;
    }
    if (!dropped.empty()) {
      dropped += ", ";
    }
    dropped += name;
  }

  if (!dropped.empty()) {
    logger.log(LogLevel::Debug, "dropped non-allowlisted request headers", {{"headers", dropped}});
  }
  return filtered;
}

}  // namespace enginebridge
