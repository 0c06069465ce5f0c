// Repository: cuebridge
// Component: Snapshot
// Purpose: Immutable picture of remote timer / playback / event state.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_MODEL_SNAPSHOT_HPP_
#define CUEBRIDGE_MODEL_SNAPSHOT_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace cuebridge::state {
class StateReducer;
}

namespace cuebridge::model {

enum class PlaybackState {
  kStopped = 0,
  kPlaying = 1,
  kPaused = 2,
  kRolling = 3,
};

// Short name as the server reports it ("stop", "play", "pause", "roll").
const char* PlaybackStateName(PlaybackState state);

// Where a Snapshot's contents came from.
//   kLive:    folded from a trusted full-state message (and deltas after it)
//   kUnknown: synthetic; start-up or the boundary after a reconnect
enum class SnapshotOrigin {
  kUnknown = 0,
  kLive = 1,
};

// Reference to a rundown event as the server described it in the message
// that produced the current Snapshot. Not an authoritative copy: the rundown
// can change without notice.
struct EventRef {
  std::string event_id;
  std::string cue;
  std::optional<int32_t> index;  // Rundown position; shifts when rundown is edited
  std::string title;
  std::optional<int64_t> duration_ms;
  std::string note;
  std::string colour;              // As entered in the rundown, e.g. "#779BE7"
  bool is_public = false;
  bool skip = false;
  std::optional<int64_t> time_start_ms;  // Scheduled, ms since midnight
  std::optional<int64_t> time_end_ms;
  std::string timer_type;          // "count-down", "count-up", "clock", ...
};

bool operator==(const EventRef& a, const EventRef& b);
inline bool operator!=(const EventRef& a, const EventRef& b) { return !(a == b); }

// Snapshot is replaced wholesale on every inbound update. Only the initial
// unknown-origin value can be made outside StateReducer.
class Snapshot {
 public:
  // Empty, Stopped, no event, origin kUnknown, revision 0.
  static Snapshot Initial();

  const std::optional<int64_t>& timer_ms() const { return timer_ms_; }
  PlaybackState playback_state() const { return playback_state_; }
  const std::optional<EventRef>& current_event() const { return current_event_; }
  const std::optional<EventRef>& next_event() const { return next_event_; }
  const std::optional<int64_t>& elapsed_ms() const { return elapsed_ms_; }
  const std::optional<int64_t>& duration_ms() const { return duration_ms_; }
  const std::optional<int64_t>& expected_end_ms() const { return expected_end_ms_; }
  const std::optional<int64_t>& started_at_ms() const { return started_at_ms_; }
  const std::optional<int64_t>& finished_at_ms() const { return finished_at_ms_; }
  const std::optional<std::string>& timer_phase() const { return timer_phase_; }
  const std::optional<std::string>& server_version() const { return server_version_; }
  SnapshotOrigin origin() const { return origin_; }
  uint64_t revision() const { return revision_; }

  bool IsOvertime() const { return timer_ms_.has_value() && *timer_ms_ < 0; }

  // Identity of the loaded event, empty when none.
  std::string CurrentEventId() const {
    return current_event_ ? current_event_->event_id : std::string();
  }

 private:
  friend class cuebridge::state::StateReducer;

  Snapshot() = default;

  std::optional<int64_t> timer_ms_;
  PlaybackState playback_state_ = PlaybackState::kStopped;
  std::optional<EventRef> current_event_;
  std::optional<EventRef> next_event_;
  std::optional<int64_t> elapsed_ms_;
  std::optional<int64_t> duration_ms_;
  std::optional<int64_t> expected_end_ms_;
  std::optional<int64_t> started_at_ms_;
  std::optional<int64_t> finished_at_ms_;
  std::optional<std::string> timer_phase_;
  std::optional<std::string> server_version_;
  SnapshotOrigin origin_ = SnapshotOrigin::kUnknown;
  uint64_t revision_ = 0;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

}  // namespace cuebridge::model

#endif  // CUEBRIDGE_MODEL_SNAPSHOT_HPP_
