#pragma once

#include <string>
#include <vector>

#include "enginebridge/buffer_reconciler.hpp"
#include "enginebridge/frame.hpp"
#include "enginebridge/logging.hpp"
#include "enginebridge/thinking_framer.hpp"

namespace enginebridge {

/**
 * Per-session translation of backend socket frames into output frames. Both
 * the event-stream and the aggregate sink drive one of these, so their text
 * output is identical for the same input.
 */
class StreamTranslator {
public:
  explicit StreamTranslator(const Logger& logger);

  /**
   * Feeds one socket message and appends the resulting frames to out.
   * Malformed frames are logged and skipped. Returns true once the terminal
   * signal has been reached; the close marker of an open thinking block is
   * already included in that case.
   */
  bool consume(const std::string& message, std::vector<Frame>& out);

  /** Ends the session without a terminal signal (socket closed, errored or failed). */
  void finish(std::vector<Frame>& out);

  [[nodiscard]] bool received_any_update() const { return received_any_update_; }
  [[nodiscard]] bool terminated() const { return terminated_; }

  const BufferReconciler& reconciler() const { return reconciler_; }
  const ThinkingFramer& framer() const { return framer_; }

private:
  void apply_update(const std::string& buffer, std::vector<Frame>& out);

  const Logger& logger_;
  BufferReconciler reconciler_;
  ThinkingFramer framer_;
  bool received_any_update_ = false;
  bool terminated_ = false;
};

}  // namespace enginebridge
