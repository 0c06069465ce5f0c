// Repository: cuebridge
// Component: HTTP Channel
// Purpose: Request/response channel to the timer server's HTTP API.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_TRANSPORT_HTTP_CHANNEL_HPP_
#define CUEBRIDGE_TRANSPORT_HTTP_CHANNEL_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cuebridge/transport/TransportTypes.hpp"

namespace cuebridge::transport {

struct HttpResult {
  TransportError error = TransportError::kNone;
  std::string detail;
  HttpResponse response;

  bool ok() const { return error == TransportError::kNone; }

  static HttpResult Success(HttpResponse r) {
    HttpResult out;
    out.response = std::move(r);
    return out;
  }
  static HttpResult Failure(TransportError e, std::string d) {
    HttpResult out;
    out.error = e;
    out.detail = std::move(d);
    return out;
  }
};

// Seam between the Transport Client and the network. Production: TcpHttpChannel.
// Tests: scripted fakes. Implementations must allow concurrent Get() calls.
class IHttpChannel {
 public:
  virtual ~IHttpChannel() = default;

  // GET `path` (absolute, e.g. "/api/poll"). Never blocks past `timeout`.
  virtual HttpResult Get(const std::string& path, std::chrono::milliseconds timeout) = 0;

  // Fails in-flight and future requests promptly (shutdown).
  virtual void Cancel() = 0;
};

// HTTP/1.1 over a fresh non-blocking TCP connection per request
// ("Connection: close"). poll() is sliced so Cancel() is observed within
// kPollSliceMs. Supports Content-Length, chunked and read-to-EOF bodies.
class TcpHttpChannel : public IHttpChannel {
 public:
  static constexpr int kPollSliceMs = 100;
  static constexpr size_t kMaxResponseBytes = 4 * 1024 * 1024;

  TcpHttpChannel(std::string host, uint16_t port);
  ~TcpHttpChannel() override = default;

  TcpHttpChannel(const TcpHttpChannel&) = delete;
  TcpHttpChannel& operator=(const TcpHttpChannel&) = delete;

  HttpResult Get(const std::string& path, std::chrono::milliseconds timeout) override;
  void Cancel() override { cancelled_.store(true, std::memory_order_release); }

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

  // Parses a complete raw HTTP/1.1 response. Exposed for tests.
  static HttpResult ParseResponse(const std::string& raw);

 private:
  // Returns a connected fd or -1 with `out` set to the failure.
  int ConnectWithDeadline(std::chrono::steady_clock::time_point deadline, HttpResult* out);

  // Waits for `events` on fd. Returns 1 ready, 0 deadline passed, -1 error/cancel.
  int WaitFd(int fd, short events, std::chrono::steady_clock::time_point deadline);

  std::string host_;
  uint16_t port_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace cuebridge::transport

#endif  // CUEBRIDGE_TRANSPORT_HTTP_CHANNEL_HPP_
