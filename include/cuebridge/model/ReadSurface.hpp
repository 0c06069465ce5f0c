// Repository: cuebridge
// Component: Read Surface
// Purpose: Snapshot → observable quantities and overtime notification payload
//          for the host platform.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_MODEL_READ_SURFACE_HPP_
#define CUEBRIDGE_MODEL_READ_SURFACE_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "cuebridge/model/Snapshot.hpp"
#include "cuebridge/model/TransitionRecord.hpp"

namespace cuebridge::model {

// Title reported when the overtime notification has no loaded event.
inline constexpr char kUnknownEventTitle[] = "Unknown";

// Sensor-style view of one Snapshot. Every field maps 1:1 to a platform
// entity or attribute.
struct ObservableState {
  std::optional<int64_t> timer_ms;        // May be negative
  PlaybackState playback = PlaybackState::kStopped;
  std::string playback_name;              // "stop" | "play" | "pause" | "roll"
  std::string event_id;                   // Empty when no event loaded
  std::string event_title;
  std::string event_cue;
  std::string event_note;
  std::string event_colour;
  bool event_is_public = false;
  bool event_skip = false;
  std::optional<int64_t> event_time_start_ms;  // Scheduled, ms since midnight
  std::optional<int64_t> event_time_end_ms;
  std::optional<int64_t> event_duration_ms;    // Planned, from the rundown
  std::string event_timer_type;
  std::string next_event_id;
  std::string next_event_title;
  bool is_overtime = false;               // timer_ms < 0
  int64_t overtime_seconds = 0;           // max(0, -timer_ms) in whole seconds
  std::optional<int64_t> elapsed_ms;
  std::optional<int64_t> duration_ms;
  std::optional<int64_t> expected_end_ms; // Absolute, epoch ms
  std::string expected_end_iso8601;       // Empty when expected_end_ms absent
  std::optional<int64_t> started_at_ms;   // Epoch ms
  std::optional<int64_t> finished_at_ms;
  std::string timer_phase;                // Server's phase name; empty when unknown
  std::string server_version;
};

ObservableState Observe(const Snapshot& snapshot);

// Whole seconds past zero; 0 when not in overtime.
int64_t OvertimeSeconds(const Snapshot& snapshot);

// One per OvertimeEntered transition.
struct OvertimeNotification {
  std::string event_title;
  int64_t overtime_seconds = 0;
  int64_t occurred_at_ms = 0;
};

// nullopt for every kind other than kOvertimeEntered.
std::optional<OvertimeNotification> ToOvertimeNotification(const TransitionRecord& record);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string FormatUtcIso8601(int64_t epoch_ms);

}  // namespace cuebridge::model

#endif  // CUEBRIDGE_MODEL_READ_SURFACE_HPP_
