// Repository: cuebridge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the receive loop, command
//          callers and gRPC handlers.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_UTIL_LOGGER_HPP_
#define CUEBRIDGE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace cuebridge::util {

// Logger writes one complete line per call under a single static mutex, so
// lines from the receive loop, dispatcher callers and gRPC threads never
// interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when CUEBRIDGE_DEBUG env is set (poll-level chatter)
// Warn  → stderr (degraded but recoverable: skipped frame, backoff)
// Error → stderr (command failures, invalid configuration)
//
// Test-only: SetErrorSink / SetWarnSink install a callback invoked for every
// matching line (in addition to the stream). Pass nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
};

}  // namespace cuebridge::util

#endif  // CUEBRIDGE_UTIL_LOGGER_HPP_
