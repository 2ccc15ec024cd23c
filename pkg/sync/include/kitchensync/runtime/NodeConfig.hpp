// Repository: KitchenSync
// Component: Node Configuration
// Purpose: Resolved configuration for leader and collaborator nodes.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_RUNTIME_NODE_CONFIG_HPP_
#define KITCHENSYNC_RUNTIME_NODE_CONFIG_HPP_

#include <cstddef>
#include <string>

#include "kitchensync/control/CommandChannel.hpp"
#include "kitchensync/cues/CueScheduler.hpp"
#include "kitchensync/leader/CollaboratorRegistry.hpp"
#include "kitchensync/playback/PlaybackSyncCorrector.hpp"
#include "kitchensync/sync/ClockBroadcaster.hpp"
#include "kitchensync/sync/SyncReceiver.hpp"
#include "kitchensync/sync/SyncTracker.hpp"

namespace kitchensync::runtime {

// Result of a leader control operation. Expected refusals ("already
// running") are reported here rather than thrown.
struct OperationResult {
  bool success;
  std::string message;

  OperationResult(bool s, const std::string& msg) : success(s), message(msg) {}
};

struct LeaderConfig {
  sync::ClockBroadcasterConfig broadcaster;
  control::CommandChannelConfig control;
  leader::RegistryConfig registry;

  // Period of the background stale-collaborator sweep.
  double eviction_interval_s = 5.0;

  // Broadcast the local media position instead of elapsed wall time while
  // the media player reports one.
  bool use_media_position = false;

  // Forwarded to collaborators in the start command.
  bool debug_mode = false;
};

inline constexpr double kMinHeartbeatIntervalS = 1.0;

struct CollaboratorConfig {
  std::string device_id = "collaborator-001";
  // Media the collaborator plays, reported at registration.
  std::string media_ref;

  sync::SyncReceiverConfig sync;
  control::CommandChannelConfig control;
  cues::CueSchedulerConfig scheduler;
  playback::CorrectorConfig corrector;
  size_t drift_window = sync::kDefaultDriftWindow;

  // Raised to kMinHeartbeatIntervalS when configured lower.
  double heartbeat_interval_s = 2.0;

  // A running session with no tick for this long is stopped.
  double sync_timeout_s = 5.0;
  double watchdog_interval_s = 1.0;
};

}  // namespace kitchensync::runtime

#endif  // KITCHENSYNC_RUNTIME_NODE_CONFIG_HPP_
