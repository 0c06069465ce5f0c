// Repository: cuebridge
// Component: Transition Detector
// Purpose: Edge-triggered comparison of successive Snapshots.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_STATE_TRANSITION_DETECTOR_HPP_
#define CUEBRIDGE_STATE_TRANSITION_DETECTOR_HPP_

#include <cstdint>
#include <vector>

#include "cuebridge/model/Snapshot.hpp"
#include "cuebridge/model/TransitionRecord.hpp"

namespace cuebridge::state {

// Compares only against the immediately preceding Snapshot.
//
//   OvertimeEntered  previous not overtime, current overtime
//   OvertimeCleared  previous overtime, current not overtime
//   PlaybackChanged  playback states differ
//   EventChanged     loaded event ids differ (title edits do not count)
//
// Nothing fires when either side is kUnknown: the first comparison after
// start-up or a reconnect has no valid previous, so a timer that is already
// negative does not re-alert.
//
// Output order follows how the server changes fields when an event is
// loaded and started: EventChanged, PlaybackChanged, then overtime.
class TransitionDetector {
 public:
  std::vector<model::TransitionRecord> Detect(const model::SnapshotPtr& previous,
                                              const model::SnapshotPtr& current,
                                              int64_t occurred_at_ms) const;
};

}  // namespace cuebridge::state

#endif  // CUEBRIDGE_STATE_TRANSITION_DETECTOR_HPP_
