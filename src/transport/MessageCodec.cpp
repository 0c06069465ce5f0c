// Repository: cuebridge
// Component: Message Codec Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/transport/MessageCodec.hpp"

#include <cmath>
#include <limits>

#include <nlohmann/json.hpp>

namespace cuebridge::transport {

using nlohmann::json;

namespace {

// Field extractors. Missing key → kMissing; explicit null → kNull; wrong type
// → kMissing (ignored, not an error).

Field<int64_t> ReadInt64(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) return {};
  if (it->is_null()) return Field<int64_t>::Null();
  // is_number_integer() is also true for unsigned values; test those first.
  if (it->is_number_unsigned()) {
    const uint64_t v = it->get<uint64_t>();
    if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return {};
    return Field<int64_t>::Of(static_cast<int64_t>(v));
  }
  if (it->is_number_integer()) return Field<int64_t>::Of(it->get<int64_t>());
  if (it->is_number_float()) {
    const double d = it->get<double>();
    if (!std::isfinite(d) || std::fabs(d) > 9.0e18) return {};
    return Field<int64_t>::Of(static_cast<int64_t>(std::llround(d)));
  }
  return {};
}

Field<std::string> ReadString(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) return {};
  if (it->is_null()) return Field<std::string>::Null();
  if (it->is_string()) return Field<std::string>::Of(it->get<std::string>());
  return {};
}

std::string StringOr(const json& obj, const char* key) {
  auto f = ReadString(obj, key);
  return f.has_value() ? f.value : std::string();
}

bool BoolOr(const json& obj, const char* key, bool fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_boolean()) return fallback;
  return it->get<bool>();
}

std::optional<int64_t> OptionalInt64(const json& obj, const char* key) {
  auto f = ReadInt64(obj, key);
  if (!f.has_value()) return std::nullopt;
  return f.value;
}

// An event object without a usable id cannot be tracked and is ignored.
Field<model::EventRef> ReadEvent(const json& value) {
  if (value.is_null()) return Field<model::EventRef>::Null();
  if (!value.is_object()) return {};

  auto id = ReadString(value, "id");
  if (!id.has_value() || id.value.empty()) return {};

  model::EventRef ev;
  ev.event_id = id.value;
  ev.cue = StringOr(value, "cue");
  ev.title = StringOr(value, "title");
  ev.duration_ms = OptionalInt64(value, "duration");
  ev.note = StringOr(value, "note");
  ev.colour = StringOr(value, "colour");
  ev.is_public = BoolOr(value, "isPublic", false);
  ev.skip = BoolOr(value, "skip", false);
  ev.time_start_ms = OptionalInt64(value, "timeStart");
  ev.time_end_ms = OptionalInt64(value, "timeEnd");
  ev.timer_type = StringOr(value, "timerType");
  auto index = ReadInt64(value, "index");
  if (index.has_value() && index.value >= 0 &&
      index.value <= std::numeric_limits<int32_t>::max()) {
    ev.index = static_cast<int32_t>(index.value);
  }
  return Field<model::EventRef>::Of(std::move(ev));
}

Field<model::EventRef> ReadEventKey(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) return {};
  return ReadEvent(*it);
}

TimerFields ReadTimer(const json& timer) {
  TimerFields t;
  if (!timer.is_object()) return t;
  t.current_ms = ReadInt64(timer, "current");
  t.elapsed_ms = ReadInt64(timer, "elapsed");
  t.duration_ms = ReadInt64(timer, "duration");
  t.expected_finish_ms = ReadInt64(timer, "expectedFinish");
  t.started_at_ms = ReadInt64(timer, "startedAt");
  t.finished_at_ms = ReadInt64(timer, "finishedAt");
  t.phase = ReadString(timer, "phase");
  t.playback = ReadString(timer, "playback");
  return t;
}

FullState ReadFullState(const json& payload) {
  FullState s;
  auto timer = payload.find("timer");
  if (timer != payload.end()) {
    s.timer = ReadTimer(*timer);
  }
  s.playback = ReadString(payload, "playback");

  s.event_now = ReadEventKey(payload, "eventNow");
  if (!s.event_now.present()) s.event_now = ReadEventKey(payload, "currentEvent");
  s.event_next = ReadEventKey(payload, "eventNext");
  if (!s.event_next.present()) s.event_next = ReadEventKey(payload, "nextEvent");
  s.version = ReadString(payload, "version");
  s.selected_event_id = StringOr(payload, "selectedEventId");

  // Rundown position and selection of the loaded event live in the runtime block.
  auto runtime = payload.find("runtime");
  if (runtime != payload.end() && runtime->is_object()) {
    if (s.event_now.has_value() && !s.event_now.value.index) {
      auto idx = ReadInt64(*runtime, "selectedEventIndex");
      if (idx.has_value() && idx.value >= 0 &&
          idx.value <= std::numeric_limits<int32_t>::max()) {
        s.event_now.value.index = static_cast<int32_t>(idx.value);
      }
    }
    if (s.selected_event_id.empty()) {
      s.selected_event_id = StringOr(*runtime, "selectedEventId");
    }
  }
  return s;
}

}  // namespace

DecodeResult DecodeMessage(const std::string& body) {
  json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return DecodeResult::Failure("body is not valid JSON");
  }
  if (!doc.is_object()) {
    return DecodeResult::Failure("body is not a JSON object");
  }

  std::string type;
  auto type_it = doc.find("type");
  if (type_it != doc.end()) {
    if (!type_it->is_string()) {
      return DecodeResult::Failure("envelope type is not a string");
    }
    type = type_it->get<std::string>();
  }

  auto payload_it = doc.find("payload");
  const json& payload = (payload_it != doc.end()) ? *payload_it : doc;

  if (type.empty() || type == "ontime") {
    if (!payload.is_object()) {
      return DecodeResult::Failure("full-state payload is not an object");
    }
    return DecodeResult::Success(ReadFullState(payload));
  }

  if (type == "ontime-timer") {
    if (!payload.is_object()) {
      return DecodeResult::Failure("timer payload is not an object");
    }
    return DecodeResult::Success(TimerDelta{ReadTimer(payload)});
  }

  if (type == "ontime-eventNow") {
    return DecodeResult::Success(EventNowDelta{ReadEvent(payload)});
  }

  if (type == "ontime-eventNext") {
    return DecodeResult::Success(EventNextDelta{ReadEvent(payload)});
  }

  if (type == "ontime-playback") {
    if (payload.is_string()) {
      return DecodeResult::Success(
          PlaybackDelta{Field<std::string>::Of(payload.get<std::string>())});
    }
    if (payload.is_object()) {
      return DecodeResult::Success(PlaybackDelta{ReadString(payload, "playback")});
    }
    return DecodeResult::Success(PlaybackDelta{});
  }

  return DecodeResult::Success(Ignored{type});
}

RundownResult DecodeNextFromRundown(const std::string& body, const std::string& current_id) {
  json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return RundownResult::Failure("rundown is not valid JSON");
  }
  const json* entries = &doc;
  if (doc.is_object()) {
    auto payload = doc.find("payload");
    if (payload == doc.end()) return RundownResult::Failure("rundown has no payload");
    entries = &*payload;
  }
  if (!entries->is_array()) {
    return RundownResult::Failure("rundown payload is not an array");
  }

  bool found_current = false;
  for (const json& entry : *entries) {
    if (!entry.is_object() || StringOr(entry, "type") != "event") continue;
    if (found_current && !BoolOr(entry, "skip", false)) {
      auto next = ReadEvent(entry);
      if (next.has_value()) return RundownResult::Found(std::move(next.value));
    }
    if (!found_current && StringOr(entry, "id") == current_id) found_current = true;
  }
  return RundownResult::Found(std::nullopt);
}

}  // namespace cuebridge::transport
