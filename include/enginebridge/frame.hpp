#pragma once

#include <string>

namespace enginebridge {

inline constexpr const char* kThinkOpenMarker = "<think>";
inline constexpr const char* kThinkCloseMarker = "</think>";

struct Frame {
  std::string text;
  bool is_marker = false;
  /** Renders as the finish chunk; text is ignored. */
  bool is_finish = false;
};

}  // namespace enginebridge
