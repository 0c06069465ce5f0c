// Repository: cuebridge
// Component: State Reducer Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/state/StateReducer.hpp"

#include <type_traits>

namespace cuebridge::state {

using model::PlaybackState;
using model::Snapshot;
using model::SnapshotOrigin;

namespace {

// std::visit helper
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::optional<PlaybackState> StateReducer::ParsePlayback(const std::string& value) {
  if (value == "stop") return PlaybackState::kStopped;
  if (value == "play") return PlaybackState::kPlaying;
  if (value == "pause" || value == "armed") return PlaybackState::kPaused;
  if (value == "roll") return PlaybackState::kRolling;
  return std::nullopt;
}

void StateReducer::ApplyTimer(const transport::TimerFields& timer, Snapshot* next) {
  timer.current_ms.ApplyTo(&next->timer_ms_);
  timer.duration_ms.ApplyTo(&next->duration_ms_);
  timer.expected_finish_ms.ApplyTo(&next->expected_end_ms_);
  timer.started_at_ms.ApplyTo(&next->started_at_ms_);
  timer.finished_at_ms.ApplyTo(&next->finished_at_ms_);
  timer.phase.ApplyTo(&next->timer_phase_);

  // Elapsed is non-negative; a negative value is malformed and ignored.
  if (timer.elapsed_ms.has_value()) {
    if (timer.elapsed_ms.value >= 0) next->elapsed_ms_ = timer.elapsed_ms.value;
  } else if (timer.elapsed_ms.kind == transport::Field<int64_t>::Kind::kNull) {
    next->elapsed_ms_.reset();
  }
}

void StateReducer::ApplyPlayback(const transport::Field<std::string>& playback,
                                 Snapshot* next) {
  if (!playback.has_value()) return;
  if (auto parsed = ParsePlayback(playback.value)) {
    next->playback_state_ = *parsed;
  }
}

bool StateReducer::SameState(const Snapshot& a, const Snapshot& b) {
  return a.timer_ms_ == b.timer_ms_ && a.playback_state_ == b.playback_state_ &&
         a.current_event_ == b.current_event_ && a.next_event_ == b.next_event_ &&
         a.elapsed_ms_ == b.elapsed_ms_ && a.duration_ms_ == b.duration_ms_ &&
         a.expected_end_ms_ == b.expected_end_ms_ && a.started_at_ms_ == b.started_at_ms_ &&
         a.finished_at_ms_ == b.finished_at_ms_ && a.timer_phase_ == b.timer_phase_ &&
         a.server_version_ == b.server_version_ && a.origin_ == b.origin_;
}

Snapshot StateReducer::Apply(const Snapshot& current,
                             const transport::RawMessage& message) const {
  const bool trusted = current.origin() == SnapshotOrigin::kLive;

  Snapshot next = std::visit(
      Overloaded{
          [&](const transport::FullState& m) {
            Snapshot folded = current;
            ApplyTimer(m.timer, &folded);
            // Top-level playback wins; timer.playback is the fallback.
            ApplyPlayback(m.playback.has_value() ? m.playback : m.timer.playback, &folded);
            m.event_now.ApplyTo(&folded.current_event_);
            m.event_next.ApplyTo(&folded.next_event_);
            m.version.ApplyTo(&folded.server_version_);
            folded.origin_ = SnapshotOrigin::kLive;
            return folded;
          },
          [&](const transport::TimerDelta& m) {
            if (!trusted) return current;
            Snapshot folded = current;
            ApplyTimer(m.timer, &folded);
            ApplyPlayback(m.timer.playback, &folded);
            return folded;
          },
          [&](const transport::EventNowDelta& m) {
            if (!trusted) return current;
            Snapshot folded = current;
            m.event_now.ApplyTo(&folded.current_event_);
            return folded;
          },
          [&](const transport::EventNextDelta& m) {
            if (!trusted) return current;
            Snapshot folded = current;
            m.event_next.ApplyTo(&folded.next_event_);
            return folded;
          },
          [&](const transport::PlaybackDelta& m) {
            if (!trusted) return current;
            Snapshot folded = current;
            ApplyPlayback(m.playback, &folded);
            return folded;
          },
          [&](const transport::Resync&) { return Snapshot::Initial(); },
          [&](const transport::Ignored&) { return current; },
      },
      message);

  if (SameState(current, next)) return current;
  next.revision_ = current.revision_ + 1;
  return next;
}

}  // namespace cuebridge::state
