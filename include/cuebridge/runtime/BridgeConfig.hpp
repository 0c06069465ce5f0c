// Repository: cuebridge
// Component: Bridge Configuration
// Purpose: Runtime settings for the bridge daemon, loaded from flags with
//          environment fallbacks.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_RUNTIME_BRIDGE_CONFIG_HPP_
#define CUEBRIDGE_RUNTIME_BRIDGE_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "cuebridge/transport/TransportClient.hpp"

namespace cuebridge::runtime {

struct BridgeConfig {
  // Timer server
  std::string host;
  int port = 4001;

  // Transport
  int64_t poll_interval_ms = 1000;
  int64_t request_timeout_ms = 10000;
  int64_t backoff_initial_ms = 1000;
  int64_t backoff_max_ms = 30000;
  int64_t stability_threshold_ms = 10000;
  int protocol_error_threshold = 5;

  // Downstream
  size_t subscriber_queue_depth = 16;
  std::string listen_address = "0.0.0.0:50071";

  // Empty when consistent; otherwise a description of the first problem.
  std::string Validate() const;

  transport::TransportOptions ToTransportOptions() const;
};

// Looks up an environment variable; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// EnvLookup backed by the process environment.
EnvLookup ProcessEnvironment();

struct ParsedArgs {
  BridgeConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Applies CUEBRIDGE_HOST / CUEBRIDGE_PORT, then command-line flags.
// Does not call Validate().
ParsedArgs ParseArgs(int argc, const char* const argv[],
                     const EnvLookup& env = ProcessEnvironment());

std::string Usage(const std::string& program_name);

}  // namespace cuebridge::runtime

#endif  // CUEBRIDGE_RUNTIME_BRIDGE_CONFIG_HPP_
