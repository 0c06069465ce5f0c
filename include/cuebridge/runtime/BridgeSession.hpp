// Repository: cuebridge
// Component: Bridge Session
// Purpose: Owns the receive loop: transport → reducer → detector → hub. Sole
//          writer of the live Snapshot.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_RUNTIME_BRIDGE_SESSION_HPP_
#define CUEBRIDGE_RUNTIME_BRIDGE_SESSION_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "cuebridge/commands/CommandDispatcher.hpp"
#include "cuebridge/hub/SubscriptionHub.hpp"
#include "cuebridge/model/Snapshot.hpp"
#include "cuebridge/runtime/BridgeConfig.hpp"
#include "cuebridge/state/StateReducer.hpp"
#include "cuebridge/state/TransitionDetector.hpp"
#include "cuebridge/time/ITimeSource.hpp"
#include "cuebridge/transport/TransportClient.hpp"

namespace cuebridge::runtime {

// BridgeSession wires one TransportClient to the state pipeline.
//
// Lifecycle: construct → Start() → ... → Stop(). Stop() is idempotent and
// also runs from the destructor. After Stop() the hub is closed and commands
// fail with kNotConnected.
//
// Threading: one internal receive thread; every other accessor may be
// called from any thread.
class BridgeSession {
 public:
  // Throws std::invalid_argument when config.Validate() fails.
  BridgeSession(BridgeConfig config, std::shared_ptr<time::ITimeSource> clock,
                transport::ChannelFactory factory = transport::DefaultChannelFactory());
  ~BridgeSession();

  BridgeSession(const BridgeSession&) = delete;
  BridgeSession& operator=(const BridgeSession&) = delete;

  // Connects and starts the receive loop. No-op when already running.
  void Start();
  void Stop();
  bool running() const { return running_.load(std::memory_order_acquire); }

  // Whole Snapshot; never null.
  model::SnapshotPtr CurrentSnapshot() const;
  transport::ConnectionStatus connection_status() const;

  commands::CommandDispatcher& dispatcher() { return dispatcher_; }
  hub::SubscriptionHub& hub() { return hub_; }
  const BridgeConfig& config() const { return config_; }

 private:
  void ReceiveLoop();
  void HandleItem(const transport::InboundItem& item);
  void HandleMessage(const transport::RawMessage& message);
  void HandleConnectionChanged(const transport::ConnectionStatus& status);

  const BridgeConfig config_;
  std::shared_ptr<time::ITimeSource> clock_;

  transport::TransportClient client_;
  state::StateReducer reducer_;
  state::TransitionDetector detector_;
  hub::SubscriptionHub hub_;
  commands::CommandDispatcher dispatcher_;

  mutable std::mutex state_mutex_;
  model::SnapshotPtr snapshot_;  // Published; only ever the initial or a live Snapshot
  transport::ConnectionStatus connection_;

  // Receive-thread only. Reducer state, including the resync boundary that
  // is never published.
  model::SnapshotPtr pipeline_;

  std::mutex lifecycle_mutex_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  bool stopped_ = false;
};

}  // namespace cuebridge::runtime

#endif  // CUEBRIDGE_RUNTIME_BRIDGE_SESSION_HPP_
