#include "enginebridge/buffer_reconciler.hpp"

namespace enginebridge {
namespace {

const ReconciliationState& empty_state() {
  static const ReconciliationState state;
  return state;
}

}  // namespace

std::string BufferReconciler::reconcile(SegmentType type, const std::string& content) {
  if (content.empty()) {
    return {};
  }

  auto [it, inserted] = states_.try_emplace(type);
  ReconciliationState& state = it->second;
  if (inserted) {
    state.previous_content = content;
    return content;
  }

  if (state.mode == ReconcileMode::Undetermined) {
    const bool extends = content.compare(0, state.previous_content.size(), state.previous_content) == 0;
    state.mode = extends ? ReconcileMode::Snapshot : ReconcileMode::Delta;
  }

  if (state.mode == ReconcileMode::Snapshot) {
    std::string delta = content.size() > state.previous_content.size()
                            ? content.substr(state.previous_content.size())
                            : std::string();
    state.previous_content = content;
    return delta;
  }

  state.previous_content += content;
  return content;
}

ReconcileMode BufferReconciler::mode(SegmentType type) const {
  auto it = states_.find(type);
  return it == states_.end() ? ReconcileMode::Undetermined : it->second.mode;
}

const std::string& BufferReconciler::previous_content(SegmentType type) const {
  auto it = states_.find(type);
  return it == states_.end() ? empty_state().previous_content : it->second.previous_content;
}

}  // namespace enginebridge
