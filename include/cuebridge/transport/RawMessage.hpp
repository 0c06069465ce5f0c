// Repository: cuebridge
// Component: Raw Message
// Purpose: Tagged variant isolating the server's wire format from the reducer.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_TRANSPORT_RAW_MESSAGE_HPP_
#define CUEBRIDGE_TRANSPORT_RAW_MESSAGE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "cuebridge/model/Snapshot.hpp"

namespace cuebridge::transport {

// One decoded field. The server distinguishes "not sent" from an explicit
// null (e.g. timer.current is null while stopped); the reducer needs both.
// Values of the wrong JSON type decode as kMissing and are ignored.
template <typename T>
struct Field {
  enum class Kind { kMissing, kNull, kValue };

  Kind kind = Kind::kMissing;
  T value{};

  static Field Null() {
    Field f;
    f.kind = Kind::kNull;
    return f;
  }
  static Field Of(T v) {
    Field f;
    f.kind = Kind::kValue;
    f.value = std::move(v);
    return f;
  }

  bool present() const { return kind != Kind::kMissing; }
  bool has_value() const { return kind == Kind::kValue; }

  // Writes this field into `target` when it was sent; leaves it alone otherwise.
  void ApplyTo(std::optional<T>* target) const {
    if (kind == Kind::kValue) {
      *target = value;
    } else if (kind == Kind::kNull) {
      target->reset();
    }
  }
};

struct TimerFields {
  Field<int64_t> current_ms;
  Field<int64_t> elapsed_ms;
  Field<int64_t> duration_ms;
  Field<int64_t> expected_finish_ms;
  Field<int64_t> started_at_ms;
  Field<int64_t> finished_at_ms;
  Field<std::string> phase;
  Field<std::string> playback;
};

// Server pushed the complete runtime state. Only a FullState re-establishes
// trust after a resync.
struct FullState {
  TimerFields timer;
  Field<std::string> playback;  // Preferred over timer.playback when sent
  Field<model::EventRef> event_now;
  Field<model::EventRef> event_next;
  Field<std::string> version;   // Server software version
  std::string selected_event_id;  // Loaded event id when eventNow is absent
};

struct TimerDelta {
  TimerFields timer;
};

struct EventNowDelta {
  Field<model::EventRef> event_now;
};

struct EventNextDelta {
  Field<model::EventRef> event_next;
};

struct PlaybackDelta {
  Field<std::string> playback;
};

// Boundary marker: the previous stream was abandoned (reconnect).
struct Resync {};

// Well-formed message of a type this core does not consume.
struct Ignored {
  std::string type;
};

using RawMessage = std::variant<FullState, TimerDelta, EventNowDelta, EventNextDelta,
                                PlaybackDelta, Resync, Ignored>;

}  // namespace cuebridge::transport

#endif  // CUEBRIDGE_TRANSPORT_RAW_MESSAGE_HPP_
