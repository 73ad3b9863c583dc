#pragma once

#include <optional>
#include <vector>

#include "enginebridge/backend_events.hpp"
#include "enginebridge/frame.hpp"

namespace enginebridge {

/**
 * Brackets runs of thinking segments with open/close markers. One framer is
 * shared by both segment types of a session.
 */
class ThinkingFramer {
public:
  /** Marker frames to emit before content of the given type. */
  std::vector<Frame> on_segment(SegmentType type);

  /** Close marker when a thinking block is still open, otherwise nothing. */
  std::optional<Frame> finish();

  [[nodiscard]] bool inside_thinking_block() const { return inside_thinking_block_; }
  const std::optional<SegmentType>& last_segment_type() const { return last_segment_type_; }

private:
  std::optional<SegmentType> last_segment_type_;
  bool inside_thinking_block_ = false;
};

}  // namespace enginebridge
