// Repository: cuebridge
// Component: Bridge Daemon Entry Point
// Purpose: Parses configuration, runs the bridge session and serves the
//          BridgeControl gRPC API until SIGINT/SIGTERM.
// Copyright (c) 2026 Cuebridge

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "bridge_service.h"
#include "cuebridge/runtime/BridgeConfig.hpp"
#include "cuebridge/runtime/BridgeSession.hpp"
#include "cuebridge/time/SystemTimeSource.hpp"
#include "cuebridge/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using cuebridge::util::Logger;

  const cuebridge::runtime::ParsedArgs args = cuebridge::runtime::ParseArgs(argc, argv);
  if (args.help) {
    std::cout << cuebridge::runtime::Usage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n" << cuebridge::runtime::Usage(argv[0]);
    return 1;
  }
  const std::string config_error = args.config.Validate();
  if (!config_error.empty()) {
    Logger::Error("[main] Invalid configuration: " + config_error);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::unique_ptr<cuebridge::runtime::BridgeSession> session;
  try {
    session = std::make_unique<cuebridge::runtime::BridgeSession>(
        args.config, std::make_shared<cuebridge::time::SystemTimeSource>());
  } catch (const std::invalid_argument& e) {
    Logger::Error(std::string("[main] ") + e.what());
    return 1;
  }

  cuebridge::service::BridgeControlImpl service(session.get());

  grpc::ServerBuilder builder;
  builder.AddListeningPort(args.config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[main] Failed to listen on " + args.config.listen_address);
    return 1;
  }
  Logger::Info("[main] BridgeControl listening on " + args.config.listen_address);

  session->Start();

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  Logger::Info("[main] Termination requested, shutting down");
  // Closing the session closes the hub, which ends every update stream.
  session->Stop();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  server->Wait();
  Logger::Info("[main] Exit");
  return 0;
}
