// Repository: cuebridge
// Component: Subscription Hub
// Purpose: Fan-out of Snapshot updates to any number of subscribers, each
//          with an independent bounded queue.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_HUB_SUBSCRIPTION_HUB_HPP_
#define CUEBRIDGE_HUB_SUBSCRIPTION_HUB_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "cuebridge/model/Snapshot.hpp"
#include "cuebridge/model/TransitionRecord.hpp"
#include "cuebridge/transport/TransportTypes.hpp"

namespace cuebridge::hub {

struct Update {
  uint64_t sequence = 0;   // Hub publish order, strictly increasing
  uint64_t revision = 0;   // Snapshot revision
  model::SnapshotPtr snapshot;
  std::vector<model::TransitionRecord> transitions;
  transport::ConnectionStatus connection;
};

class SubscriptionHub;

// Subscriber handle. Next()/TryNext() are meant for one consuming thread.
class Subscription {
  // Only SubscriptionHub can name the tag, so only it can construct handles.
  struct ConstructionTag {
    explicit ConstructionTag() = default;
  };

 public:
  Subscription(ConstructionTag, uint64_t id, size_t depth) : id_(id), depth_(depth) {}

  // Blocks up to `timeout`. nullopt on timeout, unsubscribe or hub close.
  std::optional<Update> Next(std::chrono::milliseconds timeout);

  // Never blocks.
  std::optional<Update> TryNext();

  // Updates discarded because this subscriber fell behind.
  uint64_t dropped_count() const;

  bool closed() const;
  uint64_t id() const { return id_; }

 private:
  friend class SubscriptionHub;

  // Appends, dropping the oldest unread update when full.
  void Push(const Update& update);
  void Close();

  const uint64_t id_;
  const size_t depth_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Update> queue_;
  uint64_t dropped_ = 0;
  bool closed_ = false;
};

// SubscriptionHub has one producer (the session receive loop) and any number
// of subscribers. Every subscriber sees the same total order; a subscriber
// only sees updates published after Subscribe() returned.
class SubscriptionHub {
 public:
  // Throws std::invalid_argument when queue_depth == 0.
  explicit SubscriptionHub(size_t queue_depth);
  ~SubscriptionHub();

  SubscriptionHub(const SubscriptionHub&) = delete;
  SubscriptionHub& operator=(const SubscriptionHub&) = delete;

  // Returns a closed handle when the hub is already closed.
  std::shared_ptr<Subscription> Subscribe();
  void Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  // Stamps `update.sequence` and delivers it to current subscribers.
  void Publish(Update update);

  // Closes every handle and wakes blocked Next() calls.
  void Close();

  // Most recently published update (for late readers that need a baseline).
  std::optional<Update> Latest() const;

  size_t subscriber_count() const;
  size_t queue_depth() const { return queue_depth_; }

 private:
  const size_t queue_depth_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Subscription>> subscribers_;
  std::optional<Update> latest_;
  uint64_t next_id_ = 1;
  uint64_t next_sequence_ = 1;
  bool closed_ = false;
};

}  // namespace cuebridge::hub

#endif  // CUEBRIDGE_HUB_SUBSCRIPTION_HUB_HPP_
