// Repository: cuebridge
// Component: Backoff Policy
// Purpose: Reconnect delay computation (exponential, capped, stability reset).
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_TRANSPORT_BACKOFF_POLICY_HPP_
#define CUEBRIDGE_TRANSPORT_BACKOFF_POLICY_HPP_

#include <cstdint>
#include <optional>

namespace cuebridge::transport {

// Delay sequence initial, 2*initial, 4*initial, ... capped at max.
//
// The sequence restarts from `initial` only after a Connected period of at
// least `stability_threshold`. A link that connects and drops immediately
// keeps growing its delay instead of hammering the server at the minimum.
//
// Pure bookkeeping: callers pass timestamps; no sleeping here.
class BackoffPolicy {
 public:
  BackoffPolicy(int64_t initial_ms, int64_t max_ms, int64_t stability_threshold_ms);

  // Delay to wait before the next attempt; advances the sequence.
  int64_t NextDelayMs();

  // Delay NextDelayMs() would return, without advancing.
  int64_t PeekDelayMs() const { return next_delay_ms_; }

  void OnConnected(int64_t now_ms);

  // Ends a Connected period. Resets the sequence when that period was stable.
  void OnDisconnected(int64_t now_ms);

  void Reset() { next_delay_ms_ = initial_ms_; }

  int64_t initial_ms() const { return initial_ms_; }
  int64_t max_ms() const { return max_ms_; }

 private:
  int64_t initial_ms_;
  int64_t max_ms_;
  int64_t stability_threshold_ms_;
  int64_t next_delay_ms_;
  std::optional<int64_t> connected_since_ms_;
};

}  // namespace cuebridge::transport

#endif  // CUEBRIDGE_TRANSPORT_BACKOFF_POLICY_HPP_
