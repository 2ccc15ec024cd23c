// Repository: KitchenSync
// Component: Leader Node
// Purpose: Owns the leader's clock broadcast, control channel and collaborator registry.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_RUNTIME_LEADER_NODE_HPP_
#define KITCHENSYNC_RUNTIME_LEADER_NODE_HPP_

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "kitchensync/control/CommandChannel.hpp"
#include "kitchensync/cues/Cue.hpp"
#include "kitchensync/leader/CollaboratorRegistry.hpp"
#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/playback/IMediaPlayer.hpp"
#include "kitchensync/runtime/BackgroundTask.hpp"
#include "kitchensync/runtime/NodeConfig.hpp"
#include "kitchensync/session/SessionState.hpp"
#include "kitchensync/sync/ClockBroadcaster.hpp"
#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::runtime {

struct LeaderStatus {
  bool running = false;
  double elapsed_s = 0.0;
  size_t cue_count = 0;
  uint64_t ticks_sent = 0;
  size_t online_count = 0;
  std::map<std::string, leader::CollaboratorView> collaborators;
  session::SessionStats session;
};

// LeaderNode
//
// Lifecycle:
//   1. LoadSchedule() (optional, before or after Open)
//   2. Open() binds the control channel, starts its listener and the
//      periodic stale-collaborator sweep
//   3. StartSession() / UpdateSchedule() / StopSession() any number of times
//   4. Close() (also run by the destructor)
//
// Control-plane calls are serialized by one mutex.
class LeaderNode {
 public:
  // `media` may be null (no local playback).
  LeaderNode(LeaderConfig config, std::shared_ptr<timing::MasterClock> clock,
             net::TransportFactory transport_factory,
             std::shared_ptr<playback::IMediaPlayer> media);
  ~LeaderNode();

  LeaderNode(const LeaderNode&) = delete;
  LeaderNode& operator=(const LeaderNode&) = delete;

  // Throws net::TransportError if the control port cannot be bound.
  void Open();
  void Close();

  // Replaces the schedule without telling collaborators.
  void LoadSchedule(cues::CueList cues);

  OperationResult StartSession();
  OperationResult StopSession();

  // Replaces the schedule and broadcasts update_schedule.
  OperationResult UpdateSchedule(cues::CueList cues);

  // Addressed command (falls back to broadcast for unknown ids).
  bool SendCommandTo(const std::string& collaborator_id, const protocol::Message& message);

  LeaderStatus GetStatus() const;

  bool IsRunning() const { return session_.IsRunning(); }

  leader::CollaboratorRegistry& registry() { return registry_; }
  control::CommandChannel& channel() { return channel_; }
  sync::ClockBroadcaster& broadcaster() { return broadcaster_; }

 private:
  void InstallHandlers();
  void StopSessionLocked();

  LeaderConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  std::shared_ptr<playback::IMediaPlayer> media_;

  leader::CollaboratorRegistry registry_;
  control::CommandChannel channel_;
  sync::ClockBroadcaster broadcaster_;
  session::SessionState session_;

  mutable std::mutex control_mutex_;
  cues::CueList schedule_;

  BackgroundTask eviction_task_;
};

}  // namespace kitchensync::runtime

#endif  // KITCHENSYNC_RUNTIME_LEADER_NODE_HPP_
