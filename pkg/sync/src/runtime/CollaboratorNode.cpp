// Repository: KitchenSync
// Component: Collaborator Node Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/runtime/CollaboratorNode.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <utility>
#include <variant>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::runtime {

using util::Logger;

CollaboratorNode::CollaboratorNode(CollaboratorConfig config,
                                   std::shared_ptr<timing::MasterClock> clock,
                                   net::TransportFactory transport_factory,
                                   std::shared_ptr<playback::IMediaPlayer> media,
                                   std::shared_ptr<cues::ITriggerOutput> trigger_output)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      media_(std::move(media)),
      tracker_(clock_, config_.drift_window),
      scheduler_(std::move(trigger_output), config_.scheduler),
      receiver_(config_.sync, clock_, transport_factory, bus_),
      channel_(config_.control, clock_, transport_factory),
      session_(clock_),
      heartbeat_task_("Heartbeat"),
      watchdog_task_("SyncWatchdog") {
  if (media_) {
    corrector_ =
        std::make_unique<playback::PlaybackSyncCorrector>(config_.corrector, media_, clock_);
  }
  SubscribeTickPipeline();
  InstallHandlers();
}

CollaboratorNode::~CollaboratorNode() { Close(); }

void CollaboratorNode::SubscribeTickPipeline() {
  bus_.Subscribe("SyncTracker", [this](const sync::SyncTick& tick) {
    // Not proof of sync; the watchdog keeps counting.
    if (!std::isfinite(tick.leader_time)) return;
    tracker_.RecordSync(tick.leader_time, tick.receipt_time);
    session_.SetCurrentTime(tick.leader_time);
    std::lock_guard<std::mutex> lock(tick_mutex_);
    last_tick_time_ = clock_->now_monotonic_s();
  });

  bus_.Subscribe("CueScheduler",
                 [this](const sync::SyncTick& tick) { scheduler_.Process(tick.leader_time); });

  if (corrector_) {
    bus_.Subscribe("PlaybackSyncCorrector", [this](const sync::SyncTick& tick) {
      if (!session_.IsRunning() || !media_->IsPlaying()) return;
      corrector_->OnTick(tick);
    });
  }
}

void CollaboratorNode::InstallHandlers() {
  channel_.RegisterHandler(protocol::MessageType::kStart,
                           [this](const protocol::Message& msg, const net::Endpoint&) {
                             HandleStart(std::get<protocol::StartMessage>(msg));
                           });
  channel_.RegisterHandler(protocol::MessageType::kStop,
                           [this](const protocol::Message&, const net::Endpoint&) {
                             HandleStop();
                           });
  channel_.RegisterHandler(protocol::MessageType::kUpdateSchedule,
                           [this](const protocol::Message& msg, const net::Endpoint&) {
                             HandleUpdateSchedule(std::get<protocol::UpdateScheduleMessage>(msg));
                           });
}

void CollaboratorNode::Open() {
  channel_.Listen();
  try {
    receiver_.Start();
  } catch (const net::TransportError&) {
    channel_.Stop();
    throw;
  }

  protocol::RegisterMessage reg{config_.device_id, CurrentStatus(), config_.media_ref};
  if (!channel_.Broadcast(reg)) {
    Logger::Warn("[CollaboratorNode] Registration could not be sent; heartbeats will retry "
                 "contact");
  }

  const double interval_s = std::max(config_.heartbeat_interval_s, kMinHeartbeatIntervalS);
  heartbeat_task_.Start([this, interval_s](const StopToken& token) {
    const auto interval = std::chrono::duration<double>(interval_s);
    while (!token.WaitFor(interval)) {
      SendHeartbeat();
    }
  });

  watchdog_task_.Start([this](const StopToken& token) {
    const auto interval = std::chrono::duration<double>(config_.watchdog_interval_s);
    while (!token.WaitFor(interval)) {
      CheckSyncLoss();
    }
  });

  Logger::Info("[CollaboratorNode] " + config_.device_id + " ready");
}

void CollaboratorNode::Close() {
  heartbeat_task_.Stop();
  watchdog_task_.Stop();
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_.IsRunning()) StopSessionLocked("node closing");
  }
  receiver_.Stop();
  channel_.Stop();
}

void CollaboratorNode::HandleStart(const protocol::StartMessage& start) {
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_.IsRunning()) {
      Logger::Info("[CollaboratorNode] Start while running, stopping first");
      StopSessionLocked("restart");
    }

    scheduler_.Load(start.schedule);
    if (corrector_) corrector_->Reset();
    {
      std::lock_guard<std::mutex> tick_lock(tick_mutex_);
      last_tick_time_.reset();
    }

    if (start.debug_mode && !debug_mode_.exchange(true)) {
      Logger::Info("[CollaboratorNode] Debug mode enabled by leader");
    }

    session_.Start();
    scheduler_.Start();
    if (media_ && !media_->Play()) {
      Logger::Warn("[CollaboratorNode] Local media failed to start");
    }
  }
  SendStatus("running", std::to_string(start.schedule.size()) + " cues");
}

void CollaboratorNode::HandleStop() {
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_.IsRunning()) return;
    StopSessionLocked("leader stop");
  }
  SendStatus("ready", "stopped");
}

void CollaboratorNode::HandleUpdateSchedule(const protocol::UpdateScheduleMessage& update) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  if (session_.IsRunning()) {
    // Cues already in the past stay silent for the rest of this pass.
    scheduler_.Replace(update.schedule, session_.CurrentTime());
  } else {
    scheduler_.Load(update.schedule);
  }
}

void CollaboratorNode::StopSessionLocked(const std::string& reason) {
  scheduler_.Stop();
  scheduler_.Clear();
  if (media_) media_->Stop();
  session_.Stop();
  Logger::Info("[CollaboratorNode] Session stopped (" + reason + ")");
}

bool CollaboratorNode::SendHeartbeat() {
  const double now = clock_->now_monotonic_s();
  {
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    if (last_heartbeat_time_ && (now - *last_heartbeat_time_) < kMinHeartbeatIntervalS) {
      return false;
    }
    last_heartbeat_time_ = now;
  }
  protocol::HeartbeatMessage hb{config_.device_id, CurrentStatus()};
  if (!channel_.Broadcast(hb)) return false;
  heartbeats_sent_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

bool CollaboratorNode::CheckSyncLoss() {
  std::lock_guard<std::mutex> lock(session_mutex_);
  if (!session_.IsRunning()) return false;

  const auto epoch = session_.EpochMonotonic();
  if (!epoch) return false;
  const double now = clock_->now_monotonic_s();

  double reference = *epoch;
  {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    if (last_tick_time_) reference = std::max(reference, *last_tick_time_);
  }
  if (now - reference < config_.sync_timeout_s) return false;

  char buf[128];
  std::snprintf(buf, sizeof(buf), "[CollaboratorNode] Sync lost: no tick for %.1fs",
                now - reference);
  Logger::Warn(buf);
  sync_losses_.fetch_add(1, std::memory_order_relaxed);
  StopSessionLocked("sync lost");
  SendStatus("ready", "sync lost");
  return true;
}

void CollaboratorNode::SendStatus(const std::string& status, const std::string& detail) {
  channel_.Broadcast(protocol::StatusUpdateMessage{config_.device_id, status, detail});
}

std::string CollaboratorNode::CurrentStatus() const {
  return session_.IsRunning() ? "running" : "ready";
}

CollaboratorStatus CollaboratorNode::GetStatus() const {
  CollaboratorStatus status;
  status.device_id = config_.device_id;
  status.running = session_.IsRunning();
  status.debug_mode = debug_mode_.load();
  status.session_time_s = session_.CurrentTime();
  status.sync = tracker_.Stats();
  status.cues = scheduler_.Stats();
  if (status.running) {
    status.upcoming_cues = scheduler_.UpcomingCues(status.session_time_s);
    status.recent_cues = scheduler_.RecentCues(status.session_time_s);
  }
  if (corrector_) status.correction = corrector_->Stats();
  status.ticks_received = receiver_.TicksReceived();
  status.heartbeats_sent = heartbeats_sent_.load(std::memory_order_relaxed);
  status.sync_losses = sync_losses_.load(std::memory_order_relaxed);
  return status;
}

}  // namespace kitchensync::runtime
