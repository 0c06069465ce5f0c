// Repository: cuebridge
// Component: Snapshot / Transition Record Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/model/Snapshot.hpp"
#include "cuebridge/model/TransitionRecord.hpp"

namespace cuebridge::model {

Snapshot Snapshot::Initial() {
  return Snapshot();
}

bool operator==(const EventRef& a, const EventRef& b) {
  return a.event_id == b.event_id && a.cue == b.cue && a.index == b.index &&
         a.title == b.title && a.duration_ms == b.duration_ms && a.note == b.note &&
         a.colour == b.colour && a.is_public == b.is_public && a.skip == b.skip &&
         a.time_start_ms == b.time_start_ms && a.time_end_ms == b.time_end_ms &&
         a.timer_type == b.timer_type;
}

const char* PlaybackStateName(PlaybackState state) {
  switch (state) {
    case PlaybackState::kStopped: return "stop";
    case PlaybackState::kPlaying: return "play";
    case PlaybackState::kPaused:  return "pause";
    case PlaybackState::kRolling: return "roll";
  }
  return "unknown";
}

const char* TransitionKindName(TransitionKind kind) {
  switch (kind) {
    case TransitionKind::kOvertimeEntered: return "OVERTIME_ENTERED";
    case TransitionKind::kOvertimeCleared: return "OVERTIME_CLEARED";
    case TransitionKind::kPlaybackChanged: return "PLAYBACK_CHANGED";
    case TransitionKind::kEventChanged:    return "EVENT_CHANGED";
  }
  return "UNKNOWN";
}

}  // namespace cuebridge::model
