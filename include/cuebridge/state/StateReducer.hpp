// Repository: cuebridge
// Component: State Reducer
// Purpose: Pure fold of RawMessage into the next Snapshot.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_STATE_STATE_REDUCER_HPP_
#define CUEBRIDGE_STATE_STATE_REDUCER_HPP_

#include <optional>
#include <string>

#include "cuebridge/model/Snapshot.hpp"
#include "cuebridge/transport/RawMessage.hpp"

namespace cuebridge::state {

// StateReducer is the only producer of Snapshot values. Apply() is a pure
// function of its inputs: replaying a message sequence from the same initial
// Snapshot always yields the same final Snapshot.
//
// Rules:
//   - FullState: writes every field it carries; result is kLive. Top-level
//                playback is preferred over timer.playback.
//   - Deltas:    write only their own fields; dropped when current is kUnknown
//                (deltas after a gap cannot be trusted).
//   - Resync:    empty kUnknown Snapshot.
//   - Ignored:   current returned unchanged.
// Every Snapshot that differs from `current` gets revision current+1. A
// message that changes nothing returns `current` itself, revision included.
class StateReducer {
 public:
  model::Snapshot Apply(const model::Snapshot& current,
                        const transport::RawMessage& message) const;

  // Maps the server's playback string. nullopt for strings this core does
  // not know (the caller keeps the previous state).
  static std::optional<model::PlaybackState> ParsePlayback(const std::string& value);

 private:
  static void ApplyTimer(const transport::TimerFields& timer, model::Snapshot* next);
  static void ApplyPlayback(const transport::Field<std::string>& playback,
                            model::Snapshot* next);

  // Content equality; ignores revision.
  static bool SameState(const model::Snapshot& a, const model::Snapshot& b);
};

}  // namespace cuebridge::state

#endif  // CUEBRIDGE_STATE_STATE_REDUCER_HPP_
