#pragma once

#include <map>
#include <string>

#include "enginebridge/backend_events.hpp"

namespace enginebridge {

enum class ReconcileMode { Undetermined, Snapshot, Delta };

struct ReconciliationState {
  ReconcileMode mode = ReconcileMode::Undetermined;
  std::string previous_content;
};

/**
 * Recovers incremental text from buffer updates whose semantics the backend
 * does not declare. Each segment type is tracked on its own: the first
 * update is emitted as-is, and the second one decides for the rest of the
 * session whether updates are growing snapshots (the new content extends the
 * recorded content) or plain deltas.
 *
 * The prefix test is a heuristic. Two genuine deltas where the second happens
 * to start with the first are classified as snapshots.
 */
class BufferReconciler {
public:
  /** Returns the text to emit for this update, possibly empty. */
  std::string reconcile(SegmentType type, const std::string& content);

  ReconcileMode mode(SegmentType type) const;
  const std::string& previous_content(SegmentType type) const;

private:
  std::map<SegmentType, ReconciliationState> states_;
};

}  // namespace enginebridge
