#include "enginebridge/thinking_framer.hpp"

namespace enginebridge {

std::vector<Frame> ThinkingFramer::on_segment(SegmentType type) {
  std::vector<Frame> frames;
  if (last_segment_type_ == type) {
    return frames;
  }

  if (inside_thinking_block_) {
    frames.push_back(Frame{kThinkCloseMarker, true, false});
    inside_thinking_block_ = false;
  }
  if (type == SegmentType::Thinking) {
    frames.push_back(Frame{kThinkOpenMarker, true, false});
    inside_thinking_block_ = true;
  }
  last_segment_type_ = type;
  return frames;
}

std::optional<Frame> ThinkingFramer::finish() {
  if (!inside_thinking_block_) {
    return std::nullopt;
  }
  inside_thinking_block_ = false;
  return Frame{kThinkCloseMarker, true, false};
}

}  // namespace enginebridge
