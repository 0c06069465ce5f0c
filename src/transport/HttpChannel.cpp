// Repository: cuebridge
// Component: HTTP Channel Implementation
// Purpose: Blocking HTTP/1.1 GET over non-blocking POSIX TCP sockets with
//          poll()-bounded deadlines.
// Copyright (c) 2026 Cuebridge

#include "cuebridge/transport/HttpChannel.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace cuebridge::transport {

namespace {

// Closes the wrapped descriptor on scope exit.
struct FdGuard {
  int fd = -1;
  explicit FdGuard(int f) : fd(f) {}
  ~FdGuard() {
    if (fd >= 0) ::close(fd);
  }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;
};

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
  return s.substr(b, e - b);
}

struct ResponseHead {
  int status = 0;
  std::string reason;
  bool chunked = false;
  bool has_content_length = false;
  size_t content_length = 0;
  size_t body_offset = 0;
};

// Parses status line and headers. False when the head is incomplete or bad;
// `error` distinguishes the two (empty = incomplete).
bool ParseHead(const std::string& raw, ResponseHead* head, std::string* error) {
  const size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) return false;
  head->body_offset = header_end + 4;

  size_t line_end = raw.find("\r\n");
  const std::string status_line = raw.substr(0, line_end);
  if (status_line.compare(0, 5, "HTTP/") != 0) {
    *error = "malformed status line";
    return false;
  }
  const size_t sp1 = status_line.find(' ');
  if (sp1 == std::string::npos || sp1 + 4 > status_line.size()) {
    *error = "malformed status line";
    return false;
  }
  const std::string code = status_line.substr(sp1 + 1, 3);
  if (!std::all_of(code.begin(), code.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    *error = "malformed status code";
    return false;
  }
  head->status = std::stoi(code);
  head->reason = (sp1 + 5 <= status_line.size()) ? status_line.substr(sp1 + 5) : "";

  size_t pos = line_end + 2;
  while (pos < header_end) {
    size_t eol = raw.find("\r\n", pos);
    if (eol == std::string::npos || eol > header_end) eol = header_end;
    const std::string line = raw.substr(pos, eol - pos);
    pos = eol + 2;
    const size_t colon = line.find(':');
    if (colon == std::string::npos) continue;
    const std::string name = ToLower(Trim(line.substr(0, colon)));
    const std::string value = Trim(line.substr(colon + 1));
    if (name == "content-length") {
      try {
        head->content_length = static_cast<size_t>(std::stoull(value));
        head->has_content_length = true;
      } catch (const std::exception&) {
        *error = "malformed Content-Length";
        return false;
      }
    } else if (name == "transfer-encoding") {
      head->chunked = ToLower(value).find("chunked") != std::string::npos;
    }
  }
  return true;
}

// Decodes a chunked body. False when incomplete or malformed.
bool DecodeChunked(const std::string& in, std::string* out) {
  out->clear();
  size_t pos = 0;
  while (true) {
    const size_t eol = in.find("\r\n", pos);
    if (eol == std::string::npos) return false;
    std::string size_text = in.substr(pos, eol - pos);
    const size_t semi = size_text.find(';');
    if (semi != std::string::npos) size_text.resize(semi);
    size_text = Trim(size_text);
    if (size_text.empty()) return false;
    size_t chunk = 0;
    try {
      chunk = static_cast<size_t>(std::stoull(size_text, nullptr, 16));
    } catch (const std::exception&) {
      return false;
    }
    pos = eol + 2;
    if (chunk == 0) return true;
    if (pos + chunk + 2 > in.size()) return false;
    out->append(in, pos, chunk);
    pos += chunk + 2;
  }
}

// True once `raw` holds a whole response per its framing headers.
bool IsComplete(const std::string& raw) {
  ResponseHead head;
  std::string error;
  if (!ParseHead(raw, &head, &error)) return !error.empty();
  const std::string body = raw.substr(head.body_offset);
  if (head.chunked) {
    std::string decoded;
    return DecodeChunked(body, &decoded);
  }
  if (head.has_content_length) return body.size() >= head.content_length;
  return false;  // Read to EOF
}

}  // namespace

TcpHttpChannel::TcpHttpChannel(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

int TcpHttpChannel::WaitFd(int fd, short events,
                           std::chrono::steady_clock::time_point deadline) {
  while (true) {
    if (cancelled_.load(std::memory_order_acquire)) return -1;
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return 0;
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    const int slice = static_cast<int>(std::min<int64_t>(remaining, kPollSliceMs));

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    const int rc = ::poll(&pfd, 1, std::max(slice, 1));
    if (rc < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    if (rc == 0) continue;
    if (pfd.revents & (POLLERR | POLLNVAL)) return -1;
    // POLLHUP with pending data still reads; recv() reports EOF afterwards.
    return 1;
  }
}

int TcpHttpChannel::ConnectWithDeadline(std::chrono::steady_clock::time_point deadline,
                                        HttpResult* out) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* result = nullptr;
  const std::string port_text = std::to_string(port_);
  const int gai = ::getaddrinfo(host_.c_str(), port_text.c_str(), &hints, &result);
  if (gai != 0 || result == nullptr) {
    *out = HttpResult::Failure(TransportError::kConnectionLost,
                               "resolve " + host_ + " failed: " + gai_strerror(gai));
    return -1;
  }

  std::string last_error = "no usable address";
  TransportError last_kind = TransportError::kConnectionLost;
  int connected_fd = -1;

  for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_error = std::string("socket: ") + std::strerror(errno);
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      connected_fd = fd;
      break;
    }
    if (errno != EINPROGRESS) {
      last_error = std::string("connect: ") + std::strerror(errno);
      ::close(fd);
      continue;
    }
    const int ready = WaitFd(fd, POLLOUT, deadline);
    if (ready == 1) {
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
        connected_fd = fd;
        break;
      }
      last_error = std::string("connect: ") + std::strerror(so_error);
      ::close(fd);
      continue;
    }
    ::close(fd);
    if (ready == 0) {
      last_kind = TransportError::kTimeout;
      last_error = "connect timed out";
      break;
    }
    last_error = cancelled_.load(std::memory_order_acquire) ? "cancelled" : "connect poll failed";
  }
  ::freeaddrinfo(result);

  if (connected_fd < 0) {
    *out = HttpResult::Failure(last_kind, last_error);
  }
  return connected_fd;
}

HttpResult TcpHttpChannel::Get(const std::string& path, std::chrono::milliseconds timeout) {
  if (cancelled_.load(std::memory_order_acquire)) {
    return HttpResult::Failure(TransportError::kConnectionLost, "cancelled");
  }
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  HttpResult failure;
  FdGuard guard(ConnectWithDeadline(deadline, &failure));
  if (guard.fd < 0) return failure;

  const std::string request = "GET " + path + " HTTP/1.1\r\n"
                              "Host: " + host_ + ":" + std::to_string(port_) + "\r\n"
                              "Accept: application/json\r\n"
                              "User-Agent: cuebridge\r\n"
                              "Connection: close\r\n\r\n";

  size_t sent = 0;
  while (sent < request.size()) {
    const ssize_t n = ::send(guard.fd, request.data() + sent, request.size() - sent,
                             MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      const int ready = WaitFd(guard.fd, POLLOUT, deadline);
      if (ready == 0) return HttpResult::Failure(TransportError::kTimeout, "send timed out");
      if (ready < 0) return HttpResult::Failure(TransportError::kConnectionLost, "send failed");
      continue;
    }
    return HttpResult::Failure(TransportError::kConnectionLost,
                               std::string("send: ") + std::strerror(errno));
  }

  std::string raw;
  char buf[8192];
  while (true) {
    const int ready = WaitFd(guard.fd, POLLIN, deadline);
    if (ready == 0) return HttpResult::Failure(TransportError::kTimeout, "read timed out");
    if (ready < 0) return HttpResult::Failure(TransportError::kConnectionLost, "read failed");

    const ssize_t n = ::recv(guard.fd, buf, sizeof(buf), 0);
    if (n == 0) break;  // EOF
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      return HttpResult::Failure(TransportError::kConnectionLost,
                                 std::string("recv: ") + std::strerror(errno));
    }
    raw.append(buf, static_cast<size_t>(n));
    if (raw.size() > kMaxResponseBytes) {
      return HttpResult::Failure(TransportError::kProtocolError, "response too large");
    }
    if (IsComplete(raw)) break;
  }

  if (raw.empty()) {
    return HttpResult::Failure(TransportError::kConnectionLost, "connection closed without response");
  }
  return ParseResponse(raw);
}

HttpResult TcpHttpChannel::ParseResponse(const std::string& raw) {
  ResponseHead head;
  std::string error;
  if (!ParseHead(raw, &head, &error)) {
    return HttpResult::Failure(TransportError::kProtocolError,
                               error.empty() ? "incomplete response head" : error);
  }

  HttpResponse response;
  response.status = head.status;
  response.reason = head.reason;
  const std::string body = raw.substr(head.body_offset);
  if (head.chunked) {
    if (!DecodeChunked(body, &response.body)) {
      return HttpResult::Failure(TransportError::kProtocolError, "malformed chunked body");
    }
  } else if (head.has_content_length) {
    if (body.size() < head.content_length) {
      return HttpResult::Failure(TransportError::kProtocolError, "truncated body");
    }
    response.body = body.substr(0, head.content_length);
  } else {
    response.body = body;
  }
  return HttpResult::Success(std::move(response));
}

}  // namespace cuebridge::transport
