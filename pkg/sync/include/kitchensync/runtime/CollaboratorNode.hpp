// Repository: KitchenSync
// Component: Collaborator Node
// Purpose: Follows the leader's clock; drives cues and playback correction per tick.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_RUNTIME_COLLABORATOR_NODE_HPP_
#define KITCHENSYNC_RUNTIME_COLLABORATOR_NODE_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kitchensync/control/CommandChannel.hpp"
#include "kitchensync/cues/CueScheduler.hpp"
#include "kitchensync/cues/ITriggerOutput.hpp"
#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/playback/IMediaPlayer.hpp"
#include "kitchensync/playback/PlaybackSyncCorrector.hpp"
#include "kitchensync/protocol/Messages.hpp"
#include "kitchensync/runtime/BackgroundTask.hpp"
#include "kitchensync/runtime/NodeConfig.hpp"
#include "kitchensync/session/SessionState.hpp"
#include "kitchensync/sync/SyncReceiver.hpp"
#include "kitchensync/sync/SyncTracker.hpp"
#include "kitchensync/sync/TickBus.hpp"
#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::runtime {

struct CollaboratorStatus {
  std::string device_id;
  bool running = false;
  bool debug_mode = false;
  double session_time_s = 0.0;
  sync::SyncTrackerStats sync;
  cues::CueSchedulerStats cues;
  // Around session_time_s, with the scheduler's default windows.
  cues::CueList upcoming_cues;
  cues::CueList recent_cues;
  playback::CorrectorStats correction;
  uint64_t ticks_received = 0;
  uint64_t heartbeats_sent = 0;
  uint64_t sync_losses = 0;
};

// CollaboratorNode
//
// Per received tick the bus runs, in order:
//   SyncTracker            record drift sample, adopt session time
//   CueScheduler           fire due cues (while a session runs)
//   PlaybackSyncCorrector  compare media position, seek if needed
//
// Control handlers: start (implicit stop if running), stop, update_schedule.
// Background tasks: heartbeat (rate-limited to >= 1s) and the sync watchdog,
// which stops a running session after sync_timeout_s without a tick.
class CollaboratorNode {
 public:
  // `media` may be null (cues only, no playback correction).
  CollaboratorNode(CollaboratorConfig config, std::shared_ptr<timing::MasterClock> clock,
                   net::TransportFactory transport_factory,
                   std::shared_ptr<playback::IMediaPlayer> media,
                   std::shared_ptr<cues::ITriggerOutput> trigger_output);
  ~CollaboratorNode();

  CollaboratorNode(const CollaboratorNode&) = delete;
  CollaboratorNode& operator=(const CollaboratorNode&) = delete;

  // Binds both channels, registers with the leader and starts the background
  // tasks. Throws net::TransportError if a channel cannot be bound; nothing
  // is left running in that case.
  void Open();
  void Close();

  // Control handlers. Public so they can be driven without a transport.
  void HandleStart(const protocol::StartMessage& start);
  void HandleStop();
  void HandleUpdateSchedule(const protocol::UpdateScheduleMessage& update);

  // Sends one heartbeat unless one went out less than 1s ago. Returns true
  // if a heartbeat was sent.
  bool SendHeartbeat();

  // Stops the session if it has run for at least sync_timeout_s without a
  // tick. Returns true if the session was stopped.
  bool CheckSyncLoss();

  bool IsRunning() const { return session_.IsRunning(); }
  CollaboratorStatus GetStatus() const;

  sync::TickBus& bus() { return bus_; }
  sync::SyncReceiver& receiver() { return receiver_; }
  control::CommandChannel& channel() { return channel_; }
  const sync::SyncTracker& tracker() const { return tracker_; }
  const cues::CueScheduler& scheduler() const { return scheduler_; }

 private:
  void InstallHandlers();
  void SubscribeTickPipeline();
  void StopSessionLocked(const std::string& reason);
  void SendStatus(const std::string& status, const std::string& detail);
  std::string CurrentStatus() const;

  CollaboratorConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  std::shared_ptr<playback::IMediaPlayer> media_;

  sync::TickBus bus_;
  sync::SyncTracker tracker_;
  cues::CueScheduler scheduler_;
  std::unique_ptr<playback::PlaybackSyncCorrector> corrector_;
  sync::SyncReceiver receiver_;
  control::CommandChannel channel_;
  session::SessionState session_;

  // Serializes control handlers against the watchdog.
  std::mutex session_mutex_;
  std::atomic<bool> debug_mode_{false};
  std::optional<double> last_tick_time_;
  std::mutex tick_mutex_;

  std::mutex heartbeat_mutex_;
  std::optional<double> last_heartbeat_time_;
  std::atomic<uint64_t> heartbeats_sent_{0};
  std::atomic<uint64_t> sync_losses_{0};

  BackgroundTask heartbeat_task_;
  BackgroundTask watchdog_task_;
};

}  // namespace kitchensync::runtime

#endif  // KITCHENSYNC_RUNTIME_COLLABORATOR_NODE_HPP_
