// Repository: cuebridge
// Component: Transition Record
// Purpose: Discrete domain event produced once per edge between two Snapshots.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_MODEL_TRANSITION_RECORD_HPP_
#define CUEBRIDGE_MODEL_TRANSITION_RECORD_HPP_

#include <cstdint>

#include "cuebridge/model/Snapshot.hpp"

namespace cuebridge::model {

enum class TransitionKind {
  kOvertimeEntered = 0,
  kOvertimeCleared = 1,
  kPlaybackChanged = 2,
  kEventChanged = 3,
};

const char* TransitionKindName(TransitionKind kind);

struct TransitionRecord {
  TransitionKind kind;
  SnapshotPtr previous;
  SnapshotPtr current;
  int64_t occurred_at_ms = 0;
};

}  // namespace cuebridge::model

#endif  // CUEBRIDGE_MODEL_TRANSITION_RECORD_HPP_
