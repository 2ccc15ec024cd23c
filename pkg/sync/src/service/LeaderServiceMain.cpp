// Repository: KitchenSync
// Component: Leader Control Service Entry Point
// Purpose: Hosts a LeaderNode behind the LeaderControl gRPC service.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/protocol/MessageCodec.hpp"
#include "kitchensync/runtime/LeaderNode.hpp"
#include "kitchensync/timing/MasterClock.h"
#include "kitchensync/util/Logger.hpp"
#include "leader_control_service.h"

namespace {

using kitchensync::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct ServiceArgs {
  std::string listen_address = "0.0.0.0:50061";
  std::string schedule_path;
  double tick_interval_s = 0.1;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "KitchenSync leader with the LeaderControl gRPC surface.\n"
            << "\n"
            << "  --listen ADDR         gRPC listen address (default: 0.0.0.0:50061)\n"
            << "  --schedule PATH       Initial cue schedule JSON\n"
            << "  --tick-interval S     Clock broadcast period (default: 0.1)\n"
            << "  --help                Show this help message\n"
            << "\n";
}

ServiceArgs ParseArgs(int argc, char* argv[]) {
  ServiceArgs args;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--listen" && i + 1 < argc) {
        args.listen_address = argv[++i];
      } else if (arg == "--schedule" && i + 1 < argc) {
        args.schedule_path = argv[++i];
      } else if (arg == "--tick-interval" && i + 1 < argc) {
        args.tick_interval_s = std::stod(argv[++i]);
      } else {
        args.error = "Unknown or incomplete argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid numeric value: ") + e.what();
    return args;
  }
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace ks = kitchensync;

  ServiceArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  ks::runtime::LeaderConfig config;
  config.broadcaster.tick_interval_s = args.tick_interval_s;

  auto leader = std::make_shared<ks::runtime::LeaderNode>(
      config, ks::timing::MakeSystemMasterClock(), ks::net::MakeUdpTransportFactory(), nullptr);

  if (!args.schedule_path.empty()) {
    std::ifstream file(args.schedule_path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto cues = ks::protocol::MessageCodec::DecodeSchedule(buffer.str());
    if (!cues) {
      Logger::Error("[LeaderService] Failed to load schedule: " + args.schedule_path);
      return 1;
    }
    leader->LoadSchedule(std::move(*cues));
  }

  try {
    leader->Open();
  } catch (const ks::net::TransportError& e) {
    Logger::Error(std::string("[LeaderService] Cannot open control channel: ") + e.what());
    return 1;
  }

  ks::control::LeaderControlImpl service(leader);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(args.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    Logger::Error("[LeaderService] Failed to listen on " + args.listen_address);
    leader->Close();
    return 1;
  }
  Logger::Info("[LeaderService] LeaderControl listening on " + args.listen_address);

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[LeaderService] Shutting down");
  server->Shutdown();
  leader->Close();
  return 0;
}
