// Repository: cuebridge
// Component: BridgeControl gRPC Service Implementation
// Copyright (c) 2026 Cuebridge

#include "bridge_service.h"

#include <string>

#include "cuebridge/model/ReadSurface.hpp"
#include "cuebridge/util/Logger.hpp"

namespace cuebridge {
namespace service {

using cuebridge::util::Logger;

namespace {

v1::PlaybackState ToProto(model::PlaybackState state) {
  switch (state) {
    case model::PlaybackState::kStopped:
      return v1::PLAYBACK_STATE_STOPPED;
    case model::PlaybackState::kPlaying:
      return v1::PLAYBACK_STATE_PLAYING;
    case model::PlaybackState::kPaused:
      return v1::PLAYBACK_STATE_PAUSED;
    case model::PlaybackState::kRolling:
      return v1::PLAYBACK_STATE_ROLLING;
  }
  return v1::PLAYBACK_STATE_STOPPED;
}

v1::ConnectionState ToProto(transport::ConnectionState state) {
  switch (state) {
    case transport::ConnectionState::kDisconnected:
      return v1::CONNECTION_STATE_DISCONNECTED;
    case transport::ConnectionState::kConnecting:
      return v1::CONNECTION_STATE_CONNECTING;
    case transport::ConnectionState::kConnected:
      return v1::CONNECTION_STATE_CONNECTED;
    case transport::ConnectionState::kBackoff:
      return v1::CONNECTION_STATE_BACKOFF;
  }
  return v1::CONNECTION_STATE_DISCONNECTED;
}

v1::TransitionKind ToProto(model::TransitionKind kind) {
  switch (kind) {
    case model::TransitionKind::kOvertimeEntered:
      return v1::TRANSITION_KIND_OVERTIME_ENTERED;
    case model::TransitionKind::kOvertimeCleared:
      return v1::TRANSITION_KIND_OVERTIME_CLEARED;
    case model::TransitionKind::kPlaybackChanged:
      return v1::TRANSITION_KIND_PLAYBACK_CHANGED;
    case model::TransitionKind::kEventChanged:
      return v1::TRANSITION_KIND_EVENT_CHANGED;
  }
  return v1::TRANSITION_KIND_EVENT_CHANGED;
}

v1::CommandOutcome ToProto(commands::CommandOutcome outcome) {
  switch (outcome) {
    case commands::CommandOutcome::kAccepted:
      return v1::COMMAND_OUTCOME_ACCEPTED;
    case commands::CommandOutcome::kRejected:
      return v1::COMMAND_OUTCOME_REJECTED;
    case commands::CommandOutcome::kTransportFailure:
      return v1::COMMAND_OUTCOME_TRANSPORT_FAILURE;
    case commands::CommandOutcome::kValidationFailed:
      return v1::COMMAND_OUTCOME_VALIDATION_FAILED;
    case commands::CommandOutcome::kStateError:
      return v1::COMMAND_OUTCOME_STATE_ERROR;
  }
  return v1::COMMAND_OUTCOME_TRANSPORT_FAILURE;
}

}  // namespace

void FillState(const model::Snapshot& snapshot, const transport::ConnectionStatus& connection,
               v1::BridgeState* out) {
  const model::ObservableState s = model::Observe(snapshot);
  out->set_revision(snapshot.revision());
  out->set_live(snapshot.origin() == model::SnapshotOrigin::kLive);
  out->set_has_timer(s.timer_ms.has_value());
  out->set_timer_ms(s.timer_ms.value_or(0));
  out->set_playback(ToProto(s.playback));
  if (!s.event_id.empty()) {
    auto* ev = out->mutable_current_event();
    ev->set_event_id(s.event_id);
    ev->set_title(s.event_title);
    ev->set_cue(s.event_cue);
    ev->set_note(s.event_note);
    ev->set_colour(s.event_colour);
    ev->set_is_public(s.event_is_public);
    ev->set_skip(s.event_skip);
    ev->set_has_time_start(s.event_time_start_ms.has_value());
    ev->set_time_start_ms(s.event_time_start_ms.value_or(0));
    ev->set_has_time_end(s.event_time_end_ms.has_value());
    ev->set_time_end_ms(s.event_time_end_ms.value_or(0));
    ev->set_has_duration(s.event_duration_ms.has_value());
    ev->set_duration_ms(s.event_duration_ms.value_or(0));
    ev->set_timer_type(s.event_timer_type);
  }
  if (!s.next_event_id.empty()) {
    auto* ev = out->mutable_next_event();
    ev->set_event_id(s.next_event_id);
    ev->set_title(s.next_event_title);
  }
  out->set_is_overtime(s.is_overtime);
  out->set_overtime_seconds(s.overtime_seconds);
  out->set_has_elapsed(s.elapsed_ms.has_value());
  out->set_elapsed_ms(s.elapsed_ms.value_or(0));
  out->set_has_duration(s.duration_ms.has_value());
  out->set_duration_ms(s.duration_ms.value_or(0));
  out->set_has_expected_end(s.expected_end_ms.has_value());
  out->set_expected_end_ms(s.expected_end_ms.value_or(0));
  out->set_expected_end_iso8601(s.expected_end_iso8601);
  out->set_has_started_at(s.started_at_ms.has_value());
  out->set_started_at_ms(s.started_at_ms.value_or(0));
  out->set_has_finished_at(s.finished_at_ms.has_value());
  out->set_finished_at_ms(s.finished_at_ms.value_or(0));
  out->set_timer_phase(s.timer_phase);
  out->set_server_version(s.server_version);

  auto* conn = out->mutable_connection();
  conn->set_state(ToProto(connection.state));
  if (connection.last_error != transport::TransportError::kNone) {
    conn->set_last_error(transport::TransportErrorToString(connection.last_error));
  }
  conn->set_detail(connection.detail);
}

void FillTransition(const model::TransitionRecord& record, v1::Transition* out) {
  out->set_kind(ToProto(record.kind));
  out->set_occurred_at_ms(record.occurred_at_ms);
  if (auto note = model::ToOvertimeNotification(record)) {
    auto* ot = out->mutable_overtime();
    ot->set_event_title(note->event_title);
    ot->set_overtime_seconds(note->overtime_seconds);
  }
}

void FillReply(const commands::CommandResult& result, v1::CommandReply* out) {
  out->set_outcome(ToProto(result.outcome));
  out->set_reason(result.reason);
  out->set_http_status(result.http_status);
}

grpc::Status ToStatus(const commands::CommandResult& result) {
  switch (result.outcome) {
    case commands::CommandOutcome::kAccepted:
      return grpc::Status::OK;
    case commands::CommandOutcome::kRejected:
      return grpc::Status(grpc::StatusCode::ABORTED, result.reason);
    case commands::CommandOutcome::kTransportFailure:
      return grpc::Status(grpc::StatusCode::UNAVAILABLE, result.reason);
    case commands::CommandOutcome::kValidationFailed:
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, result.reason);
    case commands::CommandOutcome::kStateError:
      return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, result.reason);
  }
  return grpc::Status(grpc::StatusCode::INTERNAL, result.reason);
}

BridgeControlImpl::BridgeControlImpl(runtime::BridgeSession* session) : session_(session) {
  Logger::Info("[BridgeControlImpl] Service initialized");
}

BridgeControlImpl::~BridgeControlImpl() {
  Logger::Info("[BridgeControlImpl] Service shutting down");
}

grpc::Status BridgeControlImpl::Reply(const char* rpc, const commands::CommandResult& result,
                                      v1::CommandReply* response) {
  FillReply(result, response);
  Logger::Debug(std::string("[") + rpc + "] " + commands::CommandOutcomeToString(result.outcome));
  return ToStatus(result);
}

grpc::Status BridgeControlImpl::GetState(grpc::ServerContext* /*context*/,
                                         const v1::GetStateRequest* /*request*/,
                                         v1::BridgeState* response) {
  FillState(*session_->CurrentSnapshot(), session_->connection_status(), response);
  return grpc::Status::OK;
}

grpc::Status BridgeControlImpl::Start(grpc::ServerContext* /*context*/,
                                      const v1::PlaybackRequest* /*request*/,
                                      v1::CommandReply* response) {
  return Reply("Start", session_->dispatcher().Start(), response);
}

grpc::Status BridgeControlImpl::Pause(grpc::ServerContext* /*context*/,
                                      const v1::PlaybackRequest* /*request*/,
                                      v1::CommandReply* response) {
  return Reply("Pause", session_->dispatcher().Pause(), response);
}

grpc::Status BridgeControlImpl::Stop(grpc::ServerContext* /*context*/,
                                     const v1::PlaybackRequest* /*request*/,
                                     v1::CommandReply* response) {
  return Reply("Stop", session_->dispatcher().Stop(), response);
}

grpc::Status BridgeControlImpl::Reload(grpc::ServerContext* /*context*/,
                                       const v1::PlaybackRequest* /*request*/,
                                       v1::CommandReply* response) {
  return Reply("Reload", session_->dispatcher().Reload(), response);
}

grpc::Status BridgeControlImpl::Roll(grpc::ServerContext* /*context*/,
                                     const v1::PlaybackRequest* /*request*/,
                                     v1::CommandReply* response) {
  return Reply("Roll", session_->dispatcher().Roll(), response);
}

grpc::Status BridgeControlImpl::LoadEvent(grpc::ServerContext* /*context*/,
                                          const v1::EventIdRequest* request,
                                          v1::CommandReply* response) {
  return Reply("LoadEvent", session_->dispatcher().LoadEventById(request->event_id()), response);
}

grpc::Status BridgeControlImpl::StartEvent(grpc::ServerContext* /*context*/,
                                           const v1::EventIdRequest* request,
                                           v1::CommandReply* response) {
  return Reply("StartEvent", session_->dispatcher().StartEvent(request->event_id()), response);
}

grpc::Status BridgeControlImpl::LoadEventIndex(grpc::ServerContext* /*context*/,
                                               const v1::EventIndexRequest* request,
                                               v1::CommandReply* response) {
  return Reply("LoadEventIndex", session_->dispatcher().LoadEventByIndex(request->index()),
               response);
}

grpc::Status BridgeControlImpl::LoadEventCue(grpc::ServerContext* /*context*/,
                                             const v1::EventCueRequest* request,
                                             v1::CommandReply* response) {
  return Reply("LoadEventCue", session_->dispatcher().LoadEventByCue(request->cue()), response);
}

grpc::Status BridgeControlImpl::AddTime(grpc::ServerContext* /*context*/,
                                        const v1::AddTimeRequest* request,
                                        v1::CommandReply* response) {
  return Reply("AddTime",
               session_->dispatcher().AddTime(request->time_ms(), request->direction()),
               response);
}

grpc::Status BridgeControlImpl::SubscribeUpdates(grpc::ServerContext* context,
                                                 const v1::SubscribeRequest* /*request*/,
                                                 grpc::ServerWriter<v1::BridgeUpdate>* writer) {
  auto subscription = session_->hub().Subscribe();
  Logger::Info("[SubscribeUpdates] Subscriber " + std::to_string(subscription->id()) +
               " attached");

  v1::BridgeUpdate baseline;
  FillState(*session_->CurrentSnapshot(), session_->connection_status(),
            baseline.mutable_state());
  bool open = writer->Write(baseline);

  while (open && !context->IsCancelled()) {
    auto update = subscription->Next(kStreamPollInterval);
    if (!update) {
      if (subscription->closed()) break;
      continue;
    }
    v1::BridgeUpdate out;
    out.set_sequence(update->sequence);
    FillState(*update->snapshot, update->connection, out.mutable_state());
    for (const auto& record : update->transitions) {
      FillTransition(record, out.add_transitions());
    }
    out.set_dropped_updates(subscription->dropped_count());
    open = writer->Write(out);
  }

  session_->hub().Unsubscribe(subscription);
  Logger::Info("[SubscribeUpdates] Subscriber " + std::to_string(subscription->id()) +
               " detached");
  return grpc::Status::OK;
}

}  // namespace service
}  // namespace cuebridge
