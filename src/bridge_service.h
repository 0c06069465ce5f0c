// Repository: cuebridge
// Component: BridgeControl gRPC Service Implementation
// Purpose: Exposes the session's read surface, command dispatcher and update
//          stream over gRPC.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_BRIDGE_SERVICE_H_
#define CUEBRIDGE_BRIDGE_SERVICE_H_

#include <chrono>

#include <grpcpp/grpcpp.h>

#include "cuebridge.grpc.pb.h"
#include "cuebridge.pb.h"
#include "cuebridge/commands/CommandDispatcher.hpp"
#include "cuebridge/hub/SubscriptionHub.hpp"
#include "cuebridge/model/Snapshot.hpp"
#include "cuebridge/model/TransitionRecord.hpp"
#include "cuebridge/runtime/BridgeSession.hpp"
#include "cuebridge/transport/TransportTypes.hpp"

namespace cuebridge {
namespace service {

// Proto conversion helpers (exposed for tests).
void FillState(const model::Snapshot& snapshot, const transport::ConnectionStatus& connection,
               v1::BridgeState* out);
void FillTransition(const model::TransitionRecord& record, v1::Transition* out);
void FillReply(const commands::CommandResult& result, v1::CommandReply* out);

// OK for accepted; otherwise the status code matching the failure class.
grpc::Status ToStatus(const commands::CommandResult& result);

// BridgeControlImpl is a thin adapter over one BridgeSession. The session
// must outlive the service.
class BridgeControlImpl final : public v1::BridgeControl::Service {
 public:
  static constexpr std::chrono::milliseconds kStreamPollInterval{250};

  explicit BridgeControlImpl(runtime::BridgeSession* session);
  ~BridgeControlImpl() override;

  BridgeControlImpl(const BridgeControlImpl&) = delete;
  BridgeControlImpl& operator=(const BridgeControlImpl&) = delete;

  grpc::Status GetState(grpc::ServerContext* context, const v1::GetStateRequest* request,
                        v1::BridgeState* response) override;

  grpc::Status Start(grpc::ServerContext* context, const v1::PlaybackRequest* request,
                     v1::CommandReply* response) override;
  grpc::Status Pause(grpc::ServerContext* context, const v1::PlaybackRequest* request,
                     v1::CommandReply* response) override;
  grpc::Status Stop(grpc::ServerContext* context, const v1::PlaybackRequest* request,
                    v1::CommandReply* response) override;
  grpc::Status Reload(grpc::ServerContext* context, const v1::PlaybackRequest* request,
                      v1::CommandReply* response) override;
  grpc::Status Roll(grpc::ServerContext* context, const v1::PlaybackRequest* request,
                    v1::CommandReply* response) override;

  grpc::Status LoadEvent(grpc::ServerContext* context, const v1::EventIdRequest* request,
                         v1::CommandReply* response) override;
  grpc::Status StartEvent(grpc::ServerContext* context, const v1::EventIdRequest* request,
                          v1::CommandReply* response) override;
  grpc::Status LoadEventIndex(grpc::ServerContext* context,
                              const v1::EventIndexRequest* request,
                              v1::CommandReply* response) override;
  grpc::Status LoadEventCue(grpc::ServerContext* context, const v1::EventCueRequest* request,
                            v1::CommandReply* response) override;
  grpc::Status AddTime(grpc::ServerContext* context, const v1::AddTimeRequest* request,
                       v1::CommandReply* response) override;

  // Server-streaming: one baseline update with the current state, then every
  // update published after subscription. Ends when the client cancels or the
  // session stops.
  grpc::Status SubscribeUpdates(grpc::ServerContext* context,
                                const v1::SubscribeRequest* request,
                                grpc::ServerWriter<v1::BridgeUpdate>* writer) override;

 private:
  grpc::Status Reply(const char* rpc, const commands::CommandResult& result,
                     v1::CommandReply* response);

  runtime::BridgeSession* session_;
};

}  // namespace service
}  // namespace cuebridge

#endif  // CUEBRIDGE_BRIDGE_SERVICE_H_
