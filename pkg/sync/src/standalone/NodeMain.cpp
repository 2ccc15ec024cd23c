// Repository: KitchenSync
// Component: Standalone Node Harness
// Purpose: Runs a leader or collaborator node on real UDP sockets.
// Copyright (c) 2025 RetroVue
//
// Media is simulated by FreeRunningMediaPlayer and fired cues are written to
// the log by LoggingTriggerOutput. Runs until SIGINT/SIGTERM.
//
// MODES OF OPERATION:
// 1. Leader:       --leader --schedule schedule.json [--auto-start]
// 2. Collaborator: --collaborator --id kitchen-2

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include "kitchensync/cues/Cue.hpp"
#include "kitchensync/cues/ITriggerOutput.hpp"
#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/playback/IMediaPlayer.hpp"
#include "kitchensync/protocol/MessageCodec.hpp"
#include "kitchensync/runtime/CollaboratorNode.hpp"
#include "kitchensync/runtime/LeaderNode.hpp"
#include "kitchensync/sync/SyncTracker.hpp"
#include "kitchensync/timing/MasterClock.h"
#include "kitchensync/util/Logger.hpp"

namespace {

using kitchensync::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  bool leader = false;
  bool collaborator = false;
  std::string id;
  std::string schedule_path;
  std::optional<double> media_duration_s;
  bool loop_media = true;
  bool auto_start = false;
  bool use_media_position = false;
  bool debug = false;
  std::optional<double> tick_interval_s;
  std::optional<uint16_t> sync_port;
  std::optional<uint16_t> control_port;
  std::string broadcast_address = kitchensync::net::kDefaultBroadcastAddress;
  double status_interval_s = 5.0;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " (--leader | --collaborator) [OPTIONS]\n"
            << "\n"
            << "Synchronized multi-device playback node.\n"
            << "\n"
            << "ROLE:\n"
            << "  --leader               Drive the session clock and cue schedule\n"
            << "  --collaborator         Follow the leader's clock\n"
            << "\n"
            << "COMMON OPTIONS:\n"
            << "  --id NAME              Node id (default: leader-001 / collaborator-001)\n"
            << "  --media-duration S     Simulated media length in seconds (default: none)\n"
            << "  --no-loop              Hold simulated media at its end instead of looping\n"
            << "  --sync-port N          Clock channel port (default: 5005)\n"
            << "  --control-port N       Control channel port (default: 5006)\n"
            << "  --broadcast ADDR       Broadcast address (default: 255.255.255.255)\n"
            << "  --status-interval S    Seconds between status lines (default: 5)\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "LEADER OPTIONS:\n"
            << "  --schedule PATH        Cue schedule JSON: {\"cues\": [...]}\n"
            << "  --tick-interval S      Clock broadcast period, 0.02..5.0 (default: 0.1)\n"
            << "  --auto-start           Start the session immediately\n"
            << "  --use-media-position   Broadcast the media position instead of elapsed time\n"
            << "  --debug                Ask collaborators to enable debug mode\n"
            << "\n"
            << "Set KITCHENSYNC_DEBUG=1 for debug logging.\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --leader --schedule schedule.json --auto-start\n"
            << "  " << program_name << " --collaborator --id kitchen-2 --media-duration 180\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--leader") {
        args.leader = true;
      } else if (arg == "--collaborator") {
        args.collaborator = true;
      } else if (arg == "--id" && i + 1 < argc) {
        args.id = argv[++i];
      } else if (arg == "--schedule" && i + 1 < argc) {
        args.schedule_path = argv[++i];
      } else if (arg == "--media-duration" && i + 1 < argc) {
        args.media_duration_s = std::stod(argv[++i]);
      } else if (arg == "--no-loop") {
        args.loop_media = false;
      } else if (arg == "--auto-start") {
        args.auto_start = true;
      } else if (arg == "--use-media-position") {
        args.use_media_position = true;
      } else if (arg == "--debug") {
        args.debug = true;
      } else if (arg == "--tick-interval" && i + 1 < argc) {
        args.tick_interval_s = std::stod(argv[++i]);
      } else if (arg == "--sync-port" && i + 1 < argc) {
        args.sync_port = static_cast<uint16_t>(std::stoul(argv[++i]));
      } else if (arg == "--control-port" && i + 1 < argc) {
        args.control_port = static_cast<uint16_t>(std::stoul(argv[++i]));
      } else if (arg == "--broadcast" && i + 1 < argc) {
        args.broadcast_address = argv[++i];
      } else if (arg == "--status-interval" && i + 1 < argc) {
        args.status_interval_s = std::stod(argv[++i]);
      } else {
        args.error = "Unknown or incomplete argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid numeric value: ") + e.what();
    return args;
  }

  if (args.leader == args.collaborator) {
    args.error = "Exactly one of --leader or --collaborator is required";
    return args;
  }
  if (args.media_duration_s && *args.media_duration_s <= 0.0) {
    args.error = "--media-duration must be positive";
    return args;
  }
  if (args.status_interval_s <= 0.0) {
    args.error = "--status-interval must be positive";
    return args;
  }
  args.valid = true;
  return args;
}

std::string ReadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return "";
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// Sleeps in short slices until the status interval elapses or a signal
// arrives. Returns false once termination was requested.
bool WaitForStatusInterval(double seconds) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                            std::chrono::duration<double>(seconds));
  while (std::chrono::steady_clock::now() < deadline) {
    if (g_termination_requested.load(std::memory_order_acquire)) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return !g_termination_requested.load(std::memory_order_acquire);
}

// =============================================================================
// Leader
// =============================================================================
int RunLeader(const CliArgs& args) {
  namespace ks = kitchensync;
  auto clock = ks::timing::MakeSystemMasterClock();

  ks::runtime::LeaderConfig config;
  if (!args.id.empty()) config.broadcaster.leader_id = args.id;
  if (args.tick_interval_s) config.broadcaster.tick_interval_s = *args.tick_interval_s;
  if (args.sync_port) config.broadcaster.sync_port = *args.sync_port;
  if (args.control_port) config.control.control_port = *args.control_port;
  config.broadcaster.broadcast_address = args.broadcast_address;
  config.control.broadcast_address = args.broadcast_address;
  config.use_media_position = args.use_media_position;
  config.debug_mode = args.debug;

  std::shared_ptr<ks::playback::IMediaPlayer> media;
  if (args.media_duration_s) {
    media = std::make_shared<ks::playback::FreeRunningMediaPlayer>(clock, args.media_duration_s,
                                                                   args.loop_media);
  }

  ks::runtime::LeaderNode leader(config, clock, ks::net::MakeUdpTransportFactory(), media);

  if (!args.schedule_path.empty()) {
    const std::string json = ReadFile(args.schedule_path);
    if (json.empty()) {
      Logger::Error("[Harness] Failed to read schedule: " + args.schedule_path);
      return 1;
    }
    auto cues = ks::protocol::MessageCodec::DecodeSchedule(json);
    if (!cues) {
      Logger::Error("[Harness] Failed to parse schedule: " + args.schedule_path);
      return 1;
    }
    leader.LoadSchedule(std::move(*cues));
  } else {
    Logger::Info("[Harness] No schedule given, using an empty schedule");
  }

  try {
    leader.Open();
  } catch (const ks::net::TransportError& e) {
    Logger::Error(std::string("[Harness] Cannot open control channel: ") + e.what());
    return 1;
  }

  if (args.auto_start) {
    auto result = leader.StartSession();
    if (!result.success) {
      Logger::Error("[Harness] " + result.message);
      leader.Close();
      return 1;
    }
  }

  while (WaitForStatusInterval(args.status_interval_s)) {
    const auto status = leader.GetStatus();
    char buf[192];
    std::snprintf(buf, sizeof(buf),
                  "[Harness] running=%s elapsed=%.1fs cues=%zu ticks=%llu collaborators=%zu/%zu",
                  status.running ? "yes" : "no", status.elapsed_s, status.cue_count,
                  static_cast<unsigned long long>(status.ticks_sent), status.online_count,
                  status.collaborators.size());
    Logger::Info(buf);
  }

  Logger::Info("[Harness] Termination requested, shutting down");
  leader.Close();
  return 0;
}

// =============================================================================
// Collaborator
// =============================================================================
int RunCollaborator(const CliArgs& args) {
  namespace ks = kitchensync;
  auto clock = ks::timing::MakeSystemMasterClock();

  ks::runtime::CollaboratorConfig config;
  if (!args.id.empty()) config.device_id = args.id;
  if (args.sync_port) config.sync.sync_port = *args.sync_port;
  if (args.control_port) config.control.control_port = *args.control_port;
  config.control.broadcast_address = args.broadcast_address;

  std::shared_ptr<ks::playback::IMediaPlayer> media;
  if (args.media_duration_s) {
    media = std::make_shared<ks::playback::FreeRunningMediaPlayer>(clock, args.media_duration_s,
                                                                   args.loop_media);
    config.media_ref = "synthetic:" + std::to_string(*args.media_duration_s) + "s";
  }
  auto trigger = std::make_shared<ks::cues::LoggingTriggerOutput>();

  ks::runtime::CollaboratorNode node(config, clock, ks::net::MakeUdpTransportFactory(), media,
                                     trigger);
  try {
    node.Open();
  } catch (const ks::net::TransportError& e) {
    Logger::Error(std::string("[Harness] Cannot open channels: ") + e.what());
    return 1;
  }

  while (WaitForStatusInterval(args.status_interval_s)) {
    const auto status = node.GetStatus();
    char buf[224];
    std::snprintf(buf, sizeof(buf),
                  "[Harness] %s running=%s time=%.1fs sync=%s drift=%+.3fs cues=%zu/%zu "
                  "loops=%llu corrections=%llu",
                  status.device_id.c_str(), status.running ? "yes" : "no",
                  status.session_time_s, ks::sync::SyncQualityName(status.sync.quality),
                  status.sync.average_drift, status.cues.fired_this_pass,
                  status.cues.total_cues, static_cast<unsigned long long>(status.cues.loop_count),
                  static_cast<unsigned long long>(status.correction.corrections));
    Logger::Info(buf);
    if (!status.recent_cues.empty()) {
      Logger::Info("[Harness]   last: " + ks::cues::DescribeCue(status.recent_cues.back()));
    }
    if (!status.upcoming_cues.empty()) {
      Logger::Info("[Harness]   next: " + ks::cues::DescribeCue(status.upcoming_cues.front()));
    }
  }

  Logger::Info("[Harness] Termination requested, shutting down");
  node.Close();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

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

  if (args.leader) {
    return RunLeader(args);
  }
  return RunCollaborator(args);
}
