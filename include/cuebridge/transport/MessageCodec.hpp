// Repository: cuebridge
// Component: Message Codec
// Purpose: Defensive decoding of Ontime JSON bodies into RawMessage.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_TRANSPORT_MESSAGE_CODEC_HPP_
#define CUEBRIDGE_TRANSPORT_MESSAGE_CODEC_HPP_

#include <optional>
#include <string>
#include <utility>

#include "cuebridge/transport/RawMessage.hpp"

namespace cuebridge::transport {

struct DecodeResult {
  std::optional<RawMessage> message;
  std::string error;  // Set when message is empty (protocol error)

  bool ok() const { return message.has_value(); }

  static DecodeResult Success(RawMessage m) { return {std::move(m), {}}; }
  static DecodeResult Failure(std::string e) { return {std::nullopt, std::move(e)}; }
};

// Decodes one body. Accepted shapes:
//   {"type": "ontime",          "payload": {...runtime...}}  → FullState
//   {"type": "ontime-timer",    "payload": {...timer...}}    → TimerDelta
//   {"type": "ontime-eventNow", "payload": {...}|null}       → EventNowDelta
//   {"type": "ontime-eventNext","payload": {...}|null}       → EventNextDelta
//   {"type": "ontime-playback", "payload": "play"}           → PlaybackDelta
//   {"payload": {...}}  (HTTP /poll response, no type)       → FullState
//   {...runtime...}     (no envelope)                        → FullState
// Any other "type" decodes to Ignored. Non-JSON or non-object bodies fail.
DecodeResult DecodeMessage(const std::string& body);

struct RundownResult {
  bool ok = false;
  std::optional<model::EventRef> next;  // nullopt when nothing follows
  std::string error;

  static RundownResult Found(std::optional<model::EventRef> n) {
    return {true, std::move(n), {}};
  }
  static RundownResult Failure(std::string e) { return {false, std::nullopt, std::move(e)}; }
};

// Looks up the event that follows `current_id` in a /data/rundown body
// ({"payload": [...]} or a bare array). Only entries of type "event" count;
// skipped events are passed over. An unknown current id yields no next event.
RundownResult DecodeNextFromRundown(const std::string& body, const std::string& current_id);

}  // namespace cuebridge::transport

#endif  // CUEBRIDGE_TRANSPORT_MESSAGE_CODEC_HPP_
