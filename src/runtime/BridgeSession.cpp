// Repository: cuebridge
// Component: Bridge Session Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/runtime/BridgeSession.hpp"

#include <stdexcept>
#include <utility>

#include "cuebridge/model/ReadSurface.hpp"
#include "cuebridge/util/Logger.hpp"

namespace cuebridge::runtime {

using cuebridge::util::Logger;

namespace {

const BridgeConfig& Validated(const BridgeConfig& config) {
  const std::string error = config.Validate();
  if (!error.empty()) {
    throw std::invalid_argument("Invalid bridge configuration: " + error);
  }
  return config;
}

}  // namespace

BridgeSession::BridgeSession(BridgeConfig config, std::shared_ptr<time::ITimeSource> clock,
                             transport::ChannelFactory factory)
    : config_(Validated(config)),
      clock_(std::move(clock)),
      client_(config_.ToTransportOptions(), std::move(factory)),
      hub_(config_.subscriber_queue_depth),
      dispatcher_([this](const transport::Command& c) { return client_.Send(c); },
                  [this] { return CurrentSnapshot(); }),
      snapshot_(std::make_shared<const model::Snapshot>(model::Snapshot::Initial())),
      pipeline_(snapshot_) {
  if (!clock_) {
    throw std::invalid_argument("BridgeSession requires a time source");
  }
}

BridgeSession::~BridgeSession() {
  Stop();
}

void BridgeSession::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load(std::memory_order_acquire) || stopped_) return;
  running_.store(true, std::memory_order_release);
  Logger::Info("[BridgeSession] Starting for " + config_.host + ":" +
               std::to_string(config_.port));
  thread_ = std::thread(&BridgeSession::ReceiveLoop, this);
}

void BridgeSession::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (stopped_) return;
  stopped_ = true;
  client_.Shutdown();
  if (thread_.joinable()) thread_.join();
  hub_.Close();
  running_.store(false, std::memory_order_release);
  Logger::Info("[BridgeSession] Stopped");
}

model::SnapshotPtr BridgeSession::CurrentSnapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return snapshot_;
}

transport::ConnectionStatus BridgeSession::connection_status() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return connection_;
}

void BridgeSession::ReceiveLoop() {
  client_.Connect(config_.host, static_cast<uint16_t>(config_.port));
  while (true) {
    transport::InboundItem item = client_.Receive();
    if (item.kind == transport::InboundItem::Kind::kTerminal) break;
    HandleItem(item);
  }
  Logger::Debug("[BridgeSession] Receive loop exited");
}

void BridgeSession::HandleItem(const transport::InboundItem& item) {
  switch (item.kind) {
    case transport::InboundItem::Kind::kConnectionChanged:
      HandleConnectionChanged(item.status);
      break;
    case transport::InboundItem::Kind::kMessage:
      if (item.message) HandleMessage(*item.message);
      break;
    case transport::InboundItem::Kind::kTerminal:
      break;
  }
}

void BridgeSession::HandleConnectionChanged(const transport::ConnectionStatus& status) {
  model::SnapshotPtr current;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    connection_ = status;
    current = snapshot_;
  }
  std::string line = std::string("[BridgeSession] Connection ") +
                     transport::ConnectionStateToString(status.state);
  if (status.last_error != transport::TransportError::kNone) {
    line += std::string(" (") + transport::TransportErrorToString(status.last_error) + ")";
  }
  Logger::Info(line);

  hub::Update update;
  update.revision = current->revision();
  update.snapshot = current;
  update.connection = status;
  hub_.Publish(std::move(update));
}

void BridgeSession::HandleMessage(const transport::RawMessage& message) {
  const model::SnapshotPtr previous = pipeline_;
  model::SnapshotPtr next =
      std::make_shared<const model::Snapshot>(reducer_.Apply(*previous, message));
  if (next->revision() == previous->revision()) return;  // Nothing changed
  pipeline_ = next;

  if (next->origin() != model::SnapshotOrigin::kLive) {
    // Readers keep the last live Snapshot until the new link sends full state.
    Logger::Info("[BridgeSession] Resync: prior state discarded");
    return;
  }

  std::vector<model::TransitionRecord> transitions =
      detector_.Detect(previous, next, clock_->NowUtcMs());

  transport::ConnectionStatus connection;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    snapshot_ = next;
    connection = connection_;
  }

  for (const auto& record : transitions) {
    if (auto note = model::ToOvertimeNotification(record)) {
      Logger::Info("[BridgeSession] Overtime: '" + note->event_title + "' +" +
                   std::to_string(note->overtime_seconds) + "s");
    } else {
      Logger::Debug(std::string("[BridgeSession] Transition ") +
                    model::TransitionKindName(record.kind));
    }
  }

  hub::Update update;
  update.revision = next->revision();
  update.snapshot = next;
  update.transitions = std::move(transitions);
  update.connection = std::move(connection);
  hub_.Publish(std::move(update));
}

}  // namespace cuebridge::runtime
