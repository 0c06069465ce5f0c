// Repository: cuebridge
// Component: Command Dispatcher Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/commands/CommandDispatcher.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "cuebridge/util/Logger.hpp"

namespace cuebridge::commands {

using cuebridge::util::Logger;
using transport::AddTimeDirection;
using transport::Command;
using transport::CommandVerb;

const char* CommandOutcomeToString(CommandOutcome outcome) {
  switch (outcome) {
    case CommandOutcome::kAccepted:
      return "ACCEPTED";
    case CommandOutcome::kRejected:
      return "REJECTED";
    case CommandOutcome::kTransportFailure:
      return "TRANSPORT_FAILURE";
    case CommandOutcome::kValidationFailed:
      return "VALIDATION_FAILED";
    case CommandOutcome::kStateError:
      return "STATE_ERROR";
  }
  return "UNKNOWN";
}

CommandDispatcher::CommandDispatcher(CommandSender sender, SnapshotReader reader)
    : sender_(std::move(sender)), reader_(std::move(reader)) {}

namespace {

Command Simple(CommandVerb verb) {
  Command c;
  c.verb = verb;
  return c;
}

CommandResult Invalid(CommandVerb verb, const std::string& reason) {
  Logger::Warn(std::string("[CommandDispatcher] ") + transport::CommandVerbName(verb) +
               " rejected locally: " + reason);
  return CommandResult::ValidationFailed(reason);
}

}  // namespace

CommandResult CommandDispatcher::Start() { return Dispatch(Simple(CommandVerb::kStart)); }
CommandResult CommandDispatcher::Pause() { return Dispatch(Simple(CommandVerb::kPause)); }
CommandResult CommandDispatcher::Stop() { return Dispatch(Simple(CommandVerb::kStop)); }
CommandResult CommandDispatcher::Reload() { return Dispatch(Simple(CommandVerb::kReload)); }
CommandResult CommandDispatcher::Roll() { return Dispatch(Simple(CommandVerb::kRoll)); }

CommandResult CommandDispatcher::LoadEventById(const std::string& event_id) {
  if (event_id.empty()) return Invalid(CommandVerb::kLoadEventById, "event id is empty");
  Command c = Simple(CommandVerb::kLoadEventById);
  c.event_id = event_id;
  return Dispatch(c);
}

CommandResult CommandDispatcher::StartEvent(const std::string& event_id) {
  if (event_id.empty()) return Invalid(CommandVerb::kStartEventById, "event id is empty");
  Command c = Simple(CommandVerb::kStartEventById);
  c.event_id = event_id;
  return Dispatch(c);
}

CommandResult CommandDispatcher::LoadEventByIndex(int32_t index) {
  if (index < 0) {
    return Invalid(CommandVerb::kLoadEventByIndex,
                   "index must be >= 0, got " + std::to_string(index));
  }
  Command c = Simple(CommandVerb::kLoadEventByIndex);
  c.index = index;
  return Dispatch(c);
}

CommandResult CommandDispatcher::LoadEventByCue(const std::string& cue) {
  if (cue.empty()) return Invalid(CommandVerb::kLoadEventByCue, "cue is empty");
  Command c = Simple(CommandVerb::kLoadEventByCue);
  c.cue = cue;
  return Dispatch(c);
}

CommandResult CommandDispatcher::AddTime(int64_t time_ms, const std::string& direction) {
  const auto parsed = ParseDirection(direction);
  if (!parsed) {
    return Invalid(CommandVerb::kAddTime,
                   "direction must be one of both|start|duration|end, got '" + direction + "'");
  }

  const model::SnapshotPtr snapshot = reader_ ? reader_() : nullptr;
  if (!snapshot || !snapshot->current_event()) {
    Logger::Warn("[CommandDispatcher] add_time refused: no event loaded");
    return CommandResult::StateError("no event loaded");
  }

  Command c = Simple(CommandVerb::kAddTime);
  c.time_ms = time_ms;
  c.direction = *parsed;
  return Dispatch(c);
}

std::optional<AddTimeDirection> CommandDispatcher::ParseDirection(const std::string& value) {
  if (value == "both") return AddTimeDirection::kBoth;
  if (value == "start") return AddTimeDirection::kStart;
  if (value == "duration") return AddTimeDirection::kDuration;
  if (value == "end") return AddTimeDirection::kEnd;
  return std::nullopt;
}

std::string CommandDispatcher::RejectionReason(const transport::HttpResponse& response) {
  const nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_object()) {
    auto it = body.find("message");
    if (it != body.end() && it->is_string() && !it->get<std::string>().empty()) {
      return it->get<std::string>();
    }
    it = body.find("payload");
    if (it != body.end() && it->is_string() && !it->get<std::string>().empty()) {
      return it->get<std::string>();
    }
  }
  std::string line = "HTTP " + std::to_string(response.status);
  if (!response.reason.empty()) line += " " + response.reason;
  return line;
}

CommandResult CommandDispatcher::Dispatch(const Command& command) {
  const char* name = transport::CommandVerbName(command.verb);
  const transport::SendResult sent = sender_(command);
  if (!sent.delivered()) {
    const transport::TransportError error =
        sent.error == transport::TransportError::kNone ? transport::TransportError::kConnectionLost
                                                       : sent.error;
    Logger::Error(std::string("[CommandDispatcher] ") + name + " not delivered: " +
                  transport::TransportErrorToString(error));
    return CommandResult::TransportFailure(error);
  }

  const transport::HttpResponse& ack = *sent.ack;
  if (!ack.IsSuccess()) {
    std::string reason = RejectionReason(ack);
    Logger::Error(std::string("[CommandDispatcher] ") + name + " rejected by server: " + reason);
    return CommandResult::Rejected(ack.status, std::move(reason));
  }
  Logger::Info(std::string("[CommandDispatcher] ") + name + " accepted");
  return CommandResult::Accepted(ack.status);
}

}  // namespace cuebridge::commands
