// Repository: cuebridge
// Component: Transport Types
// Purpose: Connection state, transport errors and the transport-level command
//          representation shared by the client, dispatcher and gRPC layer.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_TRANSPORT_TRANSPORT_TYPES_HPP_
#define CUEBRIDGE_TRANSPORT_TRANSPORT_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace cuebridge::transport {

// =============================================================================
// Transport Errors
// =============================================================================

enum class TransportError {
  kNone = 0,

  // send() issued while Disconnected / Connecting / Backoff
  kNotConnected,

  // I/O did not complete within the request timeout
  kTimeout,

  // Connect, read or write failed; or a sustained run of protocol errors
  kConnectionLost,

  // Response could not be framed or decoded
  kProtocolError,
};

const char* TransportErrorToString(TransportError error);

// =============================================================================
// Connection State
// =============================================================================

enum class ConnectionState {
  kDisconnected = 0,
  kConnecting = 1,
  kConnected = 2,
  kBackoff = 3,
};

const char* ConnectionStateToString(ConnectionState state);

// State plus the cause of the last failure (set only in kBackoff).
struct ConnectionStatus {
  ConnectionState state = ConnectionState::kDisconnected;
  TransportError last_error = TransportError::kNone;
  std::string detail;
};

// =============================================================================
// HTTP response (what the server said, before interpretation)
// =============================================================================

struct HttpResponse {
  int status = 0;
  std::string reason;
  std::string body;

  bool IsSuccess() const { return status == 200 || status == 202; }
};

// =============================================================================
// Transport-level commands
// =============================================================================

enum class CommandVerb {
  kStart,
  kPause,
  kStop,
  kReload,
  kRoll,
  kLoadEventById,
  kStartEventById,
  kLoadEventByIndex,
  kLoadEventByCue,
  kAddTime,
};

const char* CommandVerbName(CommandVerb verb);

enum class AddTimeDirection {
  kBoth,
  kStart,
  kDuration,
  kEnd,
};

// Wire name ("both", "start", "duration", "end").
const char* AddTimeDirectionName(AddTimeDirection direction);

// Validated command ready for the wire. Only the fields relevant to `verb`
// are meaningful.
struct Command {
  CommandVerb verb = CommandVerb::kStart;
  std::string event_id;
  std::string cue;
  int32_t index = 0;
  int64_t time_ms = 0;
  AddTimeDirection direction = AddTimeDirection::kBoth;
};

// Request path (relative to the API root) for a command, with path segments
// percent-encoded.
std::string EncodeCommandPath(const Command& command);

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string PercentEncode(const std::string& segment);

// =============================================================================
// Send Result
// =============================================================================

// Outcome of Send(): either the server answered (Ack, any HTTP status) or no
// delivery confirmation is possible (error != kNone).
struct SendResult {
  TransportError error;
  std::optional<HttpResponse> ack;

  bool delivered() const { return error == TransportError::kNone && ack.has_value(); }

  static SendResult Delivered(HttpResponse response) {
    return {TransportError::kNone, std::move(response)};
  }
  static SendResult Failure(TransportError e) {
    return {e, std::nullopt};
  }
};

}  // namespace cuebridge::transport

#endif  // CUEBRIDGE_TRANSPORT_TRANSPORT_TYPES_HPP_
