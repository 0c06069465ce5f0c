// Repository: cuebridge
// Component: Command Dispatcher
// Purpose: Validates operator intents and sends them to the timer server.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_COMMANDS_COMMAND_DISPATCHER_HPP_
#define CUEBRIDGE_COMMANDS_COMMAND_DISPATCHER_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "cuebridge/model/Snapshot.hpp"
#include "cuebridge/transport/TransportTypes.hpp"

namespace cuebridge::commands {

enum class CommandOutcome {
  kAccepted,
  kRejected,          // Server answered with a non-success status
  kTransportFailure,  // Not connected, timed out or link lost
  kValidationFailed,  // Bad argument; nothing was sent
  kStateError,        // Command not meaningful in the current Snapshot
};

const char* CommandOutcomeToString(CommandOutcome outcome);

struct CommandResult {
  CommandOutcome outcome = CommandOutcome::kAccepted;
  transport::TransportError transport_error = transport::TransportError::kNone;
  int http_status = 0;
  std::string reason;

  bool ok() const { return outcome == CommandOutcome::kAccepted; }

  static CommandResult Accepted(int status) {
    CommandResult r;
    r.http_status = status;
    return r;
  }
  static CommandResult Rejected(int status, std::string reason) {
    CommandResult r;
    r.outcome = CommandOutcome::kRejected;
    r.http_status = status;
    r.reason = std::move(reason);
    return r;
  }
  static CommandResult TransportFailure(transport::TransportError error) {
    CommandResult r;
    r.outcome = CommandOutcome::kTransportFailure;
    r.transport_error = error;
    r.reason = transport::TransportErrorToString(error);
    return r;
  }
  static CommandResult ValidationFailed(std::string reason) {
    CommandResult r;
    r.outcome = CommandOutcome::kValidationFailed;
    r.reason = std::move(reason);
    return r;
  }
  static CommandResult StateError(std::string reason) {
    CommandResult r;
    r.outcome = CommandOutcome::kStateError;
    r.reason = std::move(reason);
    return r;
  }
};

// Sends one validated command. Production: TransportClient::Send.
using CommandSender = std::function<transport::SendResult(const transport::Command&)>;

// Returns the live Snapshot (may be null before the first one exists).
using SnapshotReader = std::function<model::SnapshotPtr()>;

// CommandDispatcher is safe to call from any thread. It never waits for the
// Snapshot that reflects a command; callers observe that via the hub.
class CommandDispatcher {
 public:
  CommandDispatcher(CommandSender sender, SnapshotReader reader);

  CommandResult Start();
  CommandResult Pause();
  CommandResult Stop();
  CommandResult Reload();
  CommandResult Roll();
  CommandResult LoadEventById(const std::string& event_id);
  CommandResult StartEvent(const std::string& event_id);
  CommandResult LoadEventByIndex(int32_t index);
  CommandResult LoadEventByCue(const std::string& cue);

  // `direction` is one of "both", "start", "duration", "end". Negative
  // `time_ms` removes time.
  CommandResult AddTime(int64_t time_ms, const std::string& direction);

  static std::optional<transport::AddTimeDirection> ParseDirection(const std::string& value);

  // Reason text for a non-success response: JSON "message", else a string
  // "payload", else the status line.
  static std::string RejectionReason(const transport::HttpResponse& response);

 private:
  CommandResult Dispatch(const transport::Command& command);

  CommandSender sender_;
  SnapshotReader reader_;
};

}  // namespace cuebridge::commands

#endif  // CUEBRIDGE_COMMANDS_COMMAND_DISPATCHER_HPP_
