// Repository: cuebridge
// Component: Transition Detector Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/state/TransitionDetector.hpp"

namespace cuebridge::state {

using model::SnapshotOrigin;
using model::TransitionKind;
using model::TransitionRecord;

std::vector<TransitionRecord> TransitionDetector::Detect(
    const model::SnapshotPtr& previous,
    const model::SnapshotPtr& current,
    int64_t occurred_at_ms) const {
  std::vector<TransitionRecord> out;
  if (!previous || !current) return out;

  // Resync suppression.
  if (previous->origin() != SnapshotOrigin::kLive ||
      current->origin() != SnapshotOrigin::kLive) {
    return out;
  }

  auto emit = [&](TransitionKind kind) {
    out.push_back(TransitionRecord{kind, previous, current, occurred_at_ms});
  };

  if (previous->CurrentEventId() != current->CurrentEventId()) {
    emit(TransitionKind::kEventChanged);
  }

  if (previous->playback_state() != current->playback_state()) {
    emit(TransitionKind::kPlaybackChanged);
  }

  const bool was_overtime = previous->IsOvertime();
  const bool is_overtime = current->IsOvertime();
  if (!was_overtime && is_overtime) {
    emit(TransitionKind::kOvertimeEntered);
  } else if (was_overtime && !is_overtime) {
    emit(TransitionKind::kOvertimeCleared);
  }

  return out;
}

}  // namespace cuebridge::state
