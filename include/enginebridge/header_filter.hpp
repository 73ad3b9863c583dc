#pragma once

#include <map>
#include <string>

#include "enginebridge/logging.hpp"

namespace enginebridge {

/**
 * True when the header may be forwarded to the backend: its lowercase name is
 * on the fixed allow-list or starts with "openai-" / "x-openai-".
 */
bool is_allowed_header(const std::string& name);

/**
 * Returns the forwardable subset of headers. Dropped names are reported to
 * the logger at debug level.
 */
std::map<std::string, std::string> filter_forwarded_headers(const std::map<std::string, std::string>& headers,
                                                            const Logger& logger = {});

}  // namespace enginebridge
