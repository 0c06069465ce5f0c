// Repository: cuebridge
// Component: Bridge Configuration Implementation
// Copyright (c) 2026 Cuebridge

#include "cuebridge/runtime/BridgeConfig.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace cuebridge::runtime {

std::string BridgeConfig::Validate() const {
  if (host.empty()) return "host is required (--host or CUEBRIDGE_HOST)";
  if (port < 1 || port > 65535) return "port must be in 1..65535, got " + std::to_string(port);
  if (poll_interval_ms <= 0) return "poll interval must be > 0";
  if (request_timeout_ms <= 0) return "request timeout must be > 0";
  if (backoff_initial_ms <= 0) return "initial backoff must be > 0";
  if (backoff_max_ms < backoff_initial_ms) return "max backoff must be >= initial backoff";
  if (stability_threshold_ms < 0) return "stability threshold must be >= 0";
  if (protocol_error_threshold < 1) return "protocol error threshold must be >= 1";
  if (subscriber_queue_depth == 0) return "subscriber queue depth must be > 0";
  if (listen_address.empty()) return "listen address is required";
  return "";
}

transport::TransportOptions BridgeConfig::ToTransportOptions() const {
  transport::TransportOptions o;
  o.poll_interval = std::chrono::milliseconds(poll_interval_ms);
  o.request_timeout = std::chrono::milliseconds(request_timeout_ms);
  o.backoff_initial_ms = backoff_initial_ms;
  o.backoff_max_ms = backoff_max_ms;
  o.stability_threshold_ms = stability_threshold_ms;
  o.protocol_error_threshold = protocol_error_threshold;
  return o;
}

EnvLookup ProcessEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
  };
}

namespace {

// Full-string integer parse; throws std::invalid_argument on trailing junk.
int64_t ParseInt(const std::string& text) {
  size_t consumed = 0;
  const long long value = std::stoll(text, &consumed);
  if (consumed != text.size()) {
    throw std::invalid_argument("trailing characters");
  }
  return static_cast<int64_t>(value);
}

// ParseInt restricted to the range of int; throws std::out_of_range otherwise.
int ParseIntField(const std::string& text) {
  const int64_t value = ParseInt(text);
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw std::out_of_range("value does not fit in int");
  }
  return static_cast<int>(value);
}

}  // namespace

ParsedArgs ParseArgs(int argc, const char* const argv[], const EnvLookup& env) {
  ParsedArgs args;
  BridgeConfig& cfg = args.config;

  if (env) {
    if (auto host = env("CUEBRIDGE_HOST")) cfg.host = *host;
    if (auto port = env("CUEBRIDGE_PORT")) {
      try {
        cfg.port = ParseIntField(*port);
      } catch (const std::exception&) {
        args.error = "Invalid CUEBRIDGE_PORT: " + *port;
        return args;
      }
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    }

    if (arg == "--host" || arg == "--listen") {
      if (i + 1 >= argc) {
        args.error = "Missing value for " + arg;
        return args;
      }
      (arg == "--host" ? cfg.host : cfg.listen_address) = argv[++i];
      continue;
    }

    const bool numeric = arg == "--port" || arg == "--poll-ms" || arg == "--timeout-ms" ||
                         arg == "--backoff-min-ms" || arg == "--backoff-max-ms" ||
                         arg == "--stable-ms" || arg == "--protocol-errors" ||
                         arg == "--queue-depth";
    if (!numeric) {
      args.error = "Unknown argument: " + arg;
      return args;
    }
    if (i + 1 >= argc) {
      args.error = "Missing value for " + arg;
      return args;
    }
    const std::string text = argv[++i];
    int64_t value = 0;
    try {
      value = ParseInt(text);
    } catch (const std::exception&) {
      args.error = "Invalid value for " + arg + ": " + text;
      return args;
    }

    const bool int_field = arg == "--port" || arg == "--protocol-errors";
    if (int_field &&
        (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())) {
      args.error = "Value out of range for " + arg + ": " + text;
      return args;
    }

    if (arg == "--port") {
      cfg.port = static_cast<int>(value);
    } else if (arg == "--poll-ms") {
      cfg.poll_interval_ms = value;
    } else if (arg == "--timeout-ms") {
      cfg.request_timeout_ms = value;
    } else if (arg == "--backoff-min-ms") {
      cfg.backoff_initial_ms = value;
    } else if (arg == "--backoff-max-ms") {
      cfg.backoff_max_ms = value;
    } else if (arg == "--stable-ms") {
      cfg.stability_threshold_ms = value;
    } else if (arg == "--protocol-errors") {
      cfg.protocol_error_threshold = static_cast<int>(value);
    } else {
      if (value < 0) {
        args.error = "Invalid value for --queue-depth: " + text;
        return args;
      }
      cfg.subscriber_queue_depth = static_cast<size_t>(value);
    }
  }

  args.valid = true;
  return args;
}

std::string Usage(const std::string& program_name) {
  std::ostringstream out;
  out << "Usage: " << program_name << " --host HOST [OPTIONS]\n"
      << "\n"
      << "Mirrors an Ontime timer server's live state and serves it over gRPC.\n"
      << "\n"
      << "TIMER SERVER:\n"
      << "  --host HOST            Server host (env CUEBRIDGE_HOST)\n"
      << "  --port N               Server port (env CUEBRIDGE_PORT, default: 4001)\n"
      << "\n"
      << "TRANSPORT:\n"
      << "  --poll-ms N            State poll interval (default: 1000)\n"
      << "  --timeout-ms N         Per-request timeout (default: 10000)\n"
      << "  --backoff-min-ms N     First reconnect delay (default: 1000)\n"
      << "  --backoff-max-ms N     Reconnect delay cap (default: 30000)\n"
      << "  --stable-ms N          Connected time that resets backoff (default: 10000)\n"
      << "  --protocol-errors N    Consecutive bad responses treated as link loss (default: 5)\n"
      << "\n"
      << "DOWNSTREAM:\n"
      << "  --queue-depth N        Per-subscriber update queue (default: 16)\n"
      << "  --listen ADDR          gRPC listen address (default: 0.0.0.0:50071)\n"
      << "  --help                 Show this help message\n"
      << "\n"
      << "Set CUEBRIDGE_DEBUG=1 for poll-level logging.\n";
  return out.str();
}

}  // namespace cuebridge::runtime
