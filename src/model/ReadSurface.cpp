// Repository: cuebridge
// Component: Read Surface Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/model/ReadSurface.hpp"

#include <cstdio>
#include <ctime>

namespace cuebridge::model {

int64_t OvertimeSeconds(const Snapshot& snapshot) {
  if (!snapshot.IsOvertime()) return 0;
  // Magnitude in unsigned arithmetic so INT64_MIN does not overflow.
  const int64_t timer = *snapshot.timer_ms();
  const uint64_t magnitude = static_cast<uint64_t>(-(timer + 1)) + 1u;
  return static_cast<int64_t>(magnitude / 1000u);
}

ObservableState Observe(const Snapshot& snapshot) {
  ObservableState s;
  s.timer_ms = snapshot.timer_ms();
  s.playback = snapshot.playback_state();
  s.playback_name = PlaybackStateName(snapshot.playback_state());
  if (const auto& ev = snapshot.current_event()) {
    s.event_id = ev->event_id;
    s.event_title = ev->title;
    s.event_cue = ev->cue;
    s.event_note = ev->note;
    s.event_colour = ev->colour;
    s.event_is_public = ev->is_public;
    s.event_skip = ev->skip;
    s.event_time_start_ms = ev->time_start_ms;
    s.event_time_end_ms = ev->time_end_ms;
    s.event_duration_ms = ev->duration_ms;
    s.event_timer_type = ev->timer_type;
  }
  if (const auto& next = snapshot.next_event()) {
    s.next_event_id = next->event_id;
    s.next_event_title = next->title;
  }
  s.is_overtime = snapshot.IsOvertime();
  s.overtime_seconds = OvertimeSeconds(snapshot);
  s.elapsed_ms = snapshot.elapsed_ms();
  s.duration_ms = snapshot.duration_ms();
  s.expected_end_ms = snapshot.expected_end_ms();
  if (s.expected_end_ms) {
    s.expected_end_iso8601 = FormatUtcIso8601(*s.expected_end_ms);
  }
  s.started_at_ms = snapshot.started_at_ms();
  s.finished_at_ms = snapshot.finished_at_ms();
  s.timer_phase = snapshot.timer_phase().value_or("");
  s.server_version = snapshot.server_version().value_or("");
  return s;
}

std::optional<OvertimeNotification> ToOvertimeNotification(const TransitionRecord& record) {
  if (record.kind != TransitionKind::kOvertimeEntered || !record.current) {
    return std::nullopt;
  }
  OvertimeNotification n;
  const auto& ev = record.current->current_event();
  n.event_title = (ev && !ev->title.empty()) ? ev->title : kUnknownEventTitle;
  n.overtime_seconds = OvertimeSeconds(*record.current);
  n.occurred_at_ms = record.occurred_at_ms;
  return n;
}

std::string FormatUtcIso8601(int64_t epoch_ms) {
  int64_t secs = epoch_ms / 1000;
  int frac_ms = static_cast<int>(epoch_ms % 1000);
  if (frac_ms < 0) {
    frac_ms += 1000;
    secs -= 1;
  }
  time_t s = static_cast<time_t>(secs);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return "";
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace cuebridge::model
