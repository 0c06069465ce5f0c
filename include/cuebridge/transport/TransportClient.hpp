// Repository: cuebridge
// Component: Transport Client
// Purpose: Single logical link to the timer server. Polls state, sends
//          commands, reconnects with backoff and marks resync boundaries.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_TRANSPORT_TRANSPORT_CLIENT_HPP_
#define CUEBRIDGE_TRANSPORT_TRANSPORT_CLIENT_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "cuebridge/transport/BackoffPolicy.hpp"
#include "cuebridge/transport/HttpChannel.hpp"
#include "cuebridge/transport/RawMessage.hpp"
#include "cuebridge/transport/TransportTypes.hpp"

namespace cuebridge::transport {

struct TransportOptions {
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds request_timeout{10000};
  int64_t backoff_initial_ms = 1000;
  int64_t backoff_max_ms = 30000;
  int64_t stability_threshold_ms = 10000;
  int protocol_error_threshold = 5;
  std::string api_root = "/api";
};

// One element of the inbound sequence.
struct InboundItem {
  enum class Kind {
    kMessage,
    kConnectionChanged,
    kTerminal,  // Shutdown; no further items
  };

  Kind kind = Kind::kTerminal;
  std::optional<RawMessage> message;  // kMessage
  ConnectionStatus status;            // kConnectionChanged

  static InboundItem Message(RawMessage m) {
    InboundItem item;
    item.kind = Kind::kMessage;
    item.message = std::move(m);
    return item;
  }
  static InboundItem ConnectionChanged(ConnectionStatus s) {
    InboundItem item;
    item.kind = Kind::kConnectionChanged;
    item.status = std::move(s);
    return item;
  }
  static InboundItem Terminal() { return InboundItem(); }
};

using ChannelFactory =
    std::function<std::shared_ptr<IHttpChannel>(const std::string& host, uint16_t port)>;

// Factory producing TcpHttpChannel instances.
ChannelFactory DefaultChannelFactory();

// TransportClient drives the HTTP poll transport.
//
// Threading:
//   - Connect() and Receive() belong to one thread (the receive loop).
//   - Send() may be called from any thread; sends are serialized.
//   - Shutdown() may be called from any thread and interrupts waits.
//
// Inbound order after each entry into kConnected that follows an earlier
// session: ConnectionChanged(kConnected), Resync, then the first message of
// the new stream.
class TransportClient {
 public:
  explicit TransportClient(TransportOptions options,
                           ChannelFactory factory = DefaultChannelFactory());
  ~TransportClient();

  TransportClient(const TransportClient&) = delete;
  TransportClient& operator=(const TransportClient&) = delete;

  // Opens the link and performs the first poll. Returns kConnected or
  // kBackoff; the items produced are delivered by Receive().
  ConnectionState Connect(const std::string& host, uint16_t port);

  // Issues one command. Fails fast with kNotConnected unless Connected.
  // Any HTTP status counts as delivered; interpretation is the caller's.
  SendResult Send(const Command& command);

  // Next inbound item. Blocks through poll intervals and backoff waits.
  // Returns kTerminal once Shutdown() has been called.
  InboundItem Receive();

  void Shutdown();

  ConnectionStatus status() const;
  ConnectionState state() const;
  bool is_shutdown() const;

  const TransportOptions& options() const { return options_; }

 private:
  // One step of the poll state machine. Pushes zero or more items.
  void Step();

  // Issues one /poll request and folds the outcome into state.
  void Poll();

  // Looks up the next event in /data/rundown when the poll carried none.
  // Lookup failures leave `state` untouched; they never affect the link.
  void FillNextFromRundown(IHttpChannel& ch, FullState* state);

  void OnPollSuccess(RawMessage message);
  void OnProtocolError(const std::string& detail);
  void OnFailure(TransportError error, const std::string& detail);

  // Caller holds mutex_.
  void SetStateLocked(ConnectionState state, TransportError error, std::string detail);

  // Waits up to `delay`. False when shutdown interrupted the wait.
  bool WaitInterruptible(std::chrono::milliseconds delay);

  std::shared_ptr<IHttpChannel> channel() const;

  static int64_t SteadyNowMs();

  TransportOptions options_;
  ChannelFactory factory_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<InboundItem> pending_;
  std::shared_ptr<IHttpChannel> channel_;
  ConnectionStatus status_;
  bool shutdown_ = false;

  // Receive-thread only.
  BackoffPolicy backoff_;
  bool had_session_ = false;
  bool poll_immediately_ = false;
  int consecutive_protocol_errors_ = 0;

  std::mutex send_mutex_;
};

}  // namespace cuebridge::transport

#endif  // CUEBRIDGE_TRANSPORT_TRANSPORT_CLIENT_HPP_
