// Repository: cuebridge
// Component: Transport Types Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/transport/TransportTypes.hpp"

#include <cstdio>

namespace cuebridge::transport {

const char* TransportErrorToString(TransportError error) {
  switch (error) {
    case TransportError::kNone:
      return "NONE";
    case TransportError::kNotConnected:
      return "NOT_CONNECTED";
    case TransportError::kTimeout:
      return "TIMEOUT";
    case TransportError::kConnectionLost:
      return "CONNECTION_LOST";
    case TransportError::kProtocolError:
      return "PROTOCOL_ERROR";
  }
  return "UNKNOWN_ERROR";
}

const char* ConnectionStateToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "DISCONNECTED";
    case ConnectionState::kConnecting:
      return "CONNECTING";
    case ConnectionState::kConnected:
      return "CONNECTED";
    case ConnectionState::kBackoff:
      return "BACKOFF";
  }
  return "UNKNOWN";
}

const char* CommandVerbName(CommandVerb verb) {
  switch (verb) {
    case CommandVerb::kStart:            return "start";
    case CommandVerb::kPause:            return "pause";
    case CommandVerb::kStop:             return "stop";
    case CommandVerb::kReload:           return "reload";
    case CommandVerb::kRoll:             return "roll";
    case CommandVerb::kLoadEventById:    return "load_event";
    case CommandVerb::kStartEventById:   return "start_event";
    case CommandVerb::kLoadEventByIndex: return "load_event_index";
    case CommandVerb::kLoadEventByCue:   return "load_event_cue";
    case CommandVerb::kAddTime:          return "add_time";
  }
  return "unknown";
}

const char* AddTimeDirectionName(AddTimeDirection direction) {
  switch (direction) {
    case AddTimeDirection::kBoth:     return "both";
    case AddTimeDirection::kStart:    return "start";
    case AddTimeDirection::kDuration: return "duration";
    case AddTimeDirection::kEnd:      return "end";
  }
  return "both";
}

std::string PercentEncode(const std::string& segment) {
  std::string out;
  out.reserve(segment.size());
  for (unsigned char c : segment) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '.' ||
                            c == '_' || c == '~';
    if (unreserved) {
      out += static_cast<char>(c);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

std::string EncodeCommandPath(const Command& command) {
  switch (command.verb) {
    case CommandVerb::kStart:
      return "/start";
    case CommandVerb::kPause:
      return "/pause";
    case CommandVerb::kStop:
      return "/stop";
    case CommandVerb::kReload:
      return "/reload";
    case CommandVerb::kRoll:
      return "/roll";
    case CommandVerb::kLoadEventById:
      return "/load/id/" + PercentEncode(command.event_id);
    case CommandVerb::kStartEventById:
      return "/start/id/" + PercentEncode(command.event_id);
    case CommandVerb::kLoadEventByIndex:
      return "/load/index/" + std::to_string(command.index);
    case CommandVerb::kLoadEventByCue:
      return "/load/cue/" + PercentEncode(command.cue);
    case CommandVerb::kAddTime:
      return std::string("/addtime/") + AddTimeDirectionName(command.direction) +
             "/" + std::to_string(command.time_ms);
  }
  return "/";
}

}  // namespace cuebridge::transport
