// Repository: cuebridge
// Component: Subscription Hub Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/hub/SubscriptionHub.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cuebridge::hub {

// =============================================================================
// Subscription
// =============================================================================

std::optional<Update> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  if (closed_ || queue_.empty()) return std::nullopt;
  Update update = std::move(queue_.front());
  queue_.pop_front();
  return update;
}

std::optional<Update> Subscription::TryNext() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || queue_.empty()) return std::nullopt;
  Update update = std::move(queue_.front());
  queue_.pop_front();
  return update;
}

uint64_t Subscription::dropped_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void Subscription::Push(const Update& update) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    while (queue_.size() >= depth_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(update);
  }
  cv_.notify_one();
}

void Subscription::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    queue_.clear();
  }
  cv_.notify_all();
}

// =============================================================================
// SubscriptionHub
// =============================================================================

SubscriptionHub::SubscriptionHub(size_t queue_depth) : queue_depth_(queue_depth) {
  if (queue_depth_ == 0) {
    throw std::invalid_argument("SubscriptionHub requires queue_depth > 0");
  }
}

SubscriptionHub::~SubscriptionHub() {
  Close();
}

std::shared_ptr<Subscription> SubscriptionHub::Subscribe() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto sub = std::make_shared<Subscription>(Subscription::ConstructionTag{}, next_id_++,
                                            queue_depth_);
  if (closed_) {
    sub->Close();
    return sub;
  }
  subscribers_.push_back(sub);
  return sub;
}

void SubscriptionHub::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription),
                       subscribers_.end());
  }
  subscription->Close();
}

void SubscriptionHub::Publish(Update update) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return;
  update.sequence = next_sequence_++;
  for (const auto& sub : subscribers_) {
    sub->Push(update);
  }
  latest_ = std::move(update);
}

void SubscriptionHub::Close() {
  std::vector<std::shared_ptr<Subscription>> subs;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;
    subs.swap(subscribers_);
  }
  for (const auto& sub : subs) {
    sub->Close();
  }
}

std::optional<Update> SubscriptionHub::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

size_t SubscriptionHub::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

}  // namespace cuebridge::hub
