// Repository: cuebridge
// Component: Transport Client Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/transport/TransportClient.hpp"

#include <utility>
#include <variant>

#include "cuebridge/transport/MessageCodec.hpp"
#include "cuebridge/util/Logger.hpp"

namespace cuebridge::transport {

using cuebridge::util::Logger;

ChannelFactory DefaultChannelFactory() {
  return [](const std::string& host, uint16_t port) -> std::shared_ptr<IHttpChannel> {
    return std::make_shared<TcpHttpChannel>(host, port);
  };
}

TransportClient::TransportClient(TransportOptions options, ChannelFactory factory)
    : options_(std::move(options)),
      factory_(std::move(factory)),
      backoff_(options_.backoff_initial_ms, options_.backoff_max_ms,
               options_.stability_threshold_ms) {}

TransportClient::~TransportClient() {
  Shutdown();
}

int64_t TransportClient::SteadyNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

ConnectionState TransportClient::Connect(const std::string& host, uint16_t port) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return status_.state;
    if (channel_) channel_->Cancel();
    channel_ = factory_(host, port);
    SetStateLocked(ConnectionState::kConnecting, TransportError::kNone, "");
  }
  cv_.notify_all();
  Logger::Info("[TransportClient] Connecting to " + host + ":" + std::to_string(port));
  Poll();
  return state();
}

SendResult TransportClient::Send(const Command& command) {
  std::shared_ptr<IHttpChannel> ch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || status_.state != ConnectionState::kConnected || !channel_) {
      return SendResult::Failure(TransportError::kNotConnected);
    }
    ch = channel_;
  }

  const std::string path = options_.api_root + EncodeCommandPath(command);
  std::lock_guard<std::mutex> send_lock(send_mutex_);
  Logger::Debug("[TransportClient] GET " + path);
  HttpResult result = ch->Get(path, options_.request_timeout);
  if (!result.ok()) {
    Logger::Warn("[TransportClient] Send " + std::string(CommandVerbName(command.verb)) +
                 " failed: " + TransportErrorToString(result.error) +
                 (result.detail.empty() ? "" : " (" + result.detail + ")"));
    return SendResult::Failure(result.error);
  }
  return SendResult::Delivered(std::move(result.response));
}

InboundItem TransportClient::Receive() {
  while (true) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutdown_) return InboundItem::Terminal();
      if (!pending_.empty()) {
        InboundItem item = std::move(pending_.front());
        pending_.pop_front();
        return item;
      }
    }
    Step();
  }
}

void TransportClient::Shutdown() {
  std::shared_ptr<IHttpChannel> ch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return;
    shutdown_ = true;
    ch = channel_;
  }
  cv_.notify_all();
  if (ch) ch->Cancel();
  Logger::Info("[TransportClient] Shutdown");
}

ConnectionStatus TransportClient::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

ConnectionState TransportClient::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_.state;
}

bool TransportClient::is_shutdown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutdown_;
}

std::shared_ptr<IHttpChannel> TransportClient::channel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channel_;
}

void TransportClient::Step() {
  ConnectionState current;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (shutdown_) return;
    if (!channel_) {
      // Connect() not called yet.
      cv_.wait(lock, [this] { return shutdown_ || channel_ != nullptr; });
      return;
    }
    current = status_.state;
  }

  switch (current) {
    case ConnectionState::kBackoff: {
      const int64_t delay_ms = backoff_.NextDelayMs();
      Logger::Info("[TransportClient] Reconnecting in " + std::to_string(delay_ms) + "ms");
      if (!WaitInterruptible(std::chrono::milliseconds(delay_ms))) return;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        SetStateLocked(ConnectionState::kConnecting, TransportError::kNone, "");
      }
      Poll();
      return;
    }
    case ConnectionState::kDisconnected:
      Poll();
      return;
    case ConnectionState::kConnecting:
    case ConnectionState::kConnected:
      if (!poll_immediately_ && !WaitInterruptible(options_.poll_interval)) return;
      poll_immediately_ = false;
      Poll();
      return;
  }
}

void TransportClient::Poll() {
  std::shared_ptr<IHttpChannel> ch = channel();
  if (!ch || is_shutdown()) return;

  HttpResult result = ch->Get(options_.api_root + "/poll", options_.request_timeout);
  if (is_shutdown()) return;

  if (!result.ok()) {
    if (result.error == TransportError::kProtocolError) {
      OnProtocolError(result.detail);
    } else {
      OnFailure(result.error, result.detail);
    }
    return;
  }
  if (!result.response.IsSuccess()) {
    OnProtocolError("poll returned HTTP " + std::to_string(result.response.status));
    return;
  }

  DecodeResult decoded = DecodeMessage(result.response.body);
  if (!decoded.ok()) {
    OnProtocolError(decoded.error);
    return;
  }
  if (auto* full = std::get_if<FullState>(&*decoded.message)) {
    if (!full->event_next.present()) {
      FillNextFromRundown(*ch, full);
      if (is_shutdown()) return;
    }
  }
  OnPollSuccess(std::move(*decoded.message));
}

void TransportClient::FillNextFromRundown(IHttpChannel& ch, FullState* state) {
  const std::string current_id =
      state->event_now.has_value() ? state->event_now.value.event_id : state->selected_event_id;
  if (current_id.empty()) return;

  HttpResult result = ch.Get(options_.api_root + "/data/rundown", options_.request_timeout);
  if (!result.ok() || !result.response.IsSuccess()) {
    Logger::Debug("[TransportClient] Rundown unavailable: " +
                  (result.ok() ? "HTTP " + std::to_string(result.response.status)
                               : std::string(TransportErrorToString(result.error))));
    return;
  }
  RundownResult next = DecodeNextFromRundown(result.response.body, current_id);
  if (!next.ok) {
    Logger::Debug("[TransportClient] Rundown ignored: " + next.error);
    return;
  }
  state->event_next = next.next ? Field<model::EventRef>::Of(std::move(*next.next))
                                : Field<model::EventRef>::Null();
}

void TransportClient::OnPollSuccess(RawMessage message) {
  consecutive_protocol_errors_ = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  if (status_.state != ConnectionState::kConnected) {
    SetStateLocked(ConnectionState::kConnected, TransportError::kNone, "");
    if (had_session_) {
      pending_.push_back(InboundItem::Message(Resync{}));
    }
    had_session_ = true;
    backoff_.OnConnected(SteadyNowMs());
  }
  pending_.push_back(InboundItem::Message(std::move(message)));
}

void TransportClient::OnProtocolError(const std::string& detail) {
  ++consecutive_protocol_errors_;
  Logger::Warn("[TransportClient] Skipping malformed response (" +
               std::to_string(consecutive_protocol_errors_) + "/" +
               std::to_string(options_.protocol_error_threshold) + "): " + detail);
  if (consecutive_protocol_errors_ >= options_.protocol_error_threshold) {
    OnFailure(TransportError::kConnectionLost,
              std::to_string(consecutive_protocol_errors_) +
                  " consecutive protocol errors, last: " + detail);
  }
}

void TransportClient::OnFailure(TransportError error, const std::string& detail) {
  consecutive_protocol_errors_ = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return;
    if (status_.state == ConnectionState::kConnected) {
      backoff_.OnDisconnected(SteadyNowMs());
    }
    SetStateLocked(ConnectionState::kBackoff, error, detail);
  }
  Logger::Warn(std::string("[TransportClient] Link failed: ") +
               TransportErrorToString(error) + (detail.empty() ? "" : " (" + detail + ")"));
}

void TransportClient::SetStateLocked(ConnectionState state, TransportError error,
                                     std::string detail) {
  const bool changed = status_.state != state;
  status_.state = state;
  status_.last_error = error;
  status_.detail = std::move(detail);
  if (state != ConnectionState::kBackoff) {
    status_.last_error = TransportError::kNone;
  }
  if (changed) {
    pending_.push_back(InboundItem::ConnectionChanged(status_));
    Logger::Debug(std::string("[TransportClient] State ") + ConnectionStateToString(state));
  }
}

bool TransportClient::WaitInterruptible(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, delay, [this] { return shutdown_; });
}

}  // namespace cuebridge::transport
