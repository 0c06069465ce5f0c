// Repository: cuebridge
// Component: Backoff Policy Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/transport/BackoffPolicy.hpp"

#include <stdexcept>

namespace cuebridge::transport {

BackoffPolicy::BackoffPolicy(int64_t initial_ms, int64_t max_ms,
                             int64_t stability_threshold_ms)
    : initial_ms_(initial_ms),
      max_ms_(max_ms),
      stability_threshold_ms_(stability_threshold_ms),
      next_delay_ms_(initial_ms) {
  if (initial_ms_ <= 0) {
    throw std::invalid_argument("BackoffPolicy requires initial_ms > 0");
  }
  if (max_ms_ < initial_ms_) {
    throw std::invalid_argument("BackoffPolicy requires max_ms >= initial_ms");
  }
}

int64_t BackoffPolicy::NextDelayMs() {
  const int64_t delay = next_delay_ms_;
  next_delay_ms_ = next_delay_ms_ > max_ms_ / 2 ? max_ms_ : next_delay_ms_ * 2;
  return delay;
}

void BackoffPolicy::OnConnected(int64_t now_ms) {
  connected_since_ms_ = now_ms;
}

void BackoffPolicy::OnDisconnected(int64_t now_ms) {
  if (!connected_since_ms_) return;
  if (now_ms - *connected_since_ms_ >= stability_threshold_ms_) {
    Reset();
  }
  connected_since_ms_.reset();
}

}  // namespace cuebridge::transport
