#pragma once

#include <string>

namespace enginebridge::utils {

/** Random RFC 4122 version 4 UUID. */
std::string uuid4();

}  // namespace enginebridge::utils
