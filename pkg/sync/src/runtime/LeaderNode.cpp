// Repository: KitchenSync
// Component: Leader Node Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/runtime/LeaderNode.hpp"

#include <chrono>
#include <utility>
#include <variant>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::runtime {

using util::Logger;

LeaderNode::LeaderNode(LeaderConfig config, std::shared_ptr<timing::MasterClock> clock,
                       net::TransportFactory transport_factory,
                       std::shared_ptr<playback::IMediaPlayer> media)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      media_(std::move(media)),
      registry_(config_.registry, clock_),
      channel_(config_.control, clock_, transport_factory),
      broadcaster_(config_.broadcaster, clock_, transport_factory),
      session_(clock_),
      eviction_task_("CollaboratorEviction") {
  InstallHandlers();
}

LeaderNode::~LeaderNode() { Close(); }

void LeaderNode::InstallHandlers() {
  channel_.SetAddressResolver(
      [this](const std::string& id) { return registry_.AddressOf(id); });

  channel_.RegisterHandler(protocol::MessageType::kRegister,
                           [this](const protocol::Message& msg, const net::Endpoint& from) {
                             const auto& reg = std::get<protocol::RegisterMessage>(msg);
                             if (reg.device_id.empty()) return;
                             registry_.Register(reg.device_id, from, reg.status, reg.video_file);
                           });

  channel_.RegisterHandler(protocol::MessageType::kHeartbeat,
                           [this](const protocol::Message& msg, const net::Endpoint&) {
                             const auto& hb = std::get<protocol::HeartbeatMessage>(msg);
                             if (!registry_.Heartbeat(hb.device_id, hb.status)) {
                               Logger::Debug("[LeaderNode] Heartbeat from unregistered " +
                                             hb.device_id);
                             }
                           });

  channel_.RegisterHandler(protocol::MessageType::kStatusUpdate,
                           [this](const protocol::Message& msg, const net::Endpoint&) {
                             const auto& su = std::get<protocol::StatusUpdateMessage>(msg);
                             if (registry_.UpdateStatus(su.device_id, su.status)) {
                               Logger::Info("[LeaderNode] " + su.device_id + " is " + su.status +
                                            (su.detail.empty() ? "" : " (" + su.detail + ")"));
                             }
                           });
}

void LeaderNode::Open() {
  channel_.Listen();

  const auto interval = std::chrono::duration<double>(config_.eviction_interval_s);
  eviction_task_.Start([this, interval](const StopToken& token) {
    while (!token.WaitFor(interval)) {
      registry_.EvictStale();
    }
  });
  Logger::Info("[LeaderNode] Ready");
}

void LeaderNode::Close() {
  {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (session_.IsRunning()) StopSessionLocked();
  }
  eviction_task_.Stop();
  broadcaster_.Stop();
  channel_.Stop();
}

void LeaderNode::LoadSchedule(cues::CueList cues) {
  cues::SortCues(cues);
  std::lock_guard<std::mutex> lock(control_mutex_);
  schedule_ = std::move(cues);
  Logger::Info("[LeaderNode] Schedule loaded with " + std::to_string(schedule_.size()) +
               " cues");
}

OperationResult LeaderNode::StartSession() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (session_.IsRunning()) {
    return OperationResult(false, "Session already running");
  }

  const double epoch = session_.Start();
  if (media_ && !media_->Play()) {
    Logger::Warn("[LeaderNode] Local media failed to start");
  }

  sync::ClockBroadcaster::PositionSource position;
  if (config_.use_media_position && media_) {
    auto media = media_;
    position = [media]() { return media->GetPosition(); };
  }

  try {
    broadcaster_.Start(epoch, std::move(position));
  } catch (const net::TransportError& e) {
    Logger::Error(std::string("[LeaderNode] Clock broadcaster failed to start: ") + e.what());
    if (media_) media_->Stop();
    session_.Stop();
    return OperationResult(false, std::string("Clock broadcast unavailable: ") + e.what());
  }

  protocol::StartMessage start;
  start.schedule = schedule_;
  start.start_time = session_.Snapshot().start_time_utc_s.value_or(clock_->now_utc_s());
  start.debug_mode = config_.debug_mode;
  const bool sent = channel_.Broadcast(start);

  Logger::Info("[LeaderNode] Session started with " + std::to_string(schedule_.size()) +
               " cues");
  return OperationResult(true, sent ? "Session started"
                                    : "Session started; start command could not be sent");
}

OperationResult LeaderNode::StopSession() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (!session_.IsRunning()) {
    return OperationResult(false, "Session not running");
  }
  StopSessionLocked();
  return OperationResult(true, "Session stopped");
}

void LeaderNode::StopSessionLocked() {
  broadcaster_.Stop();
  if (media_) media_->Stop();
  channel_.Broadcast(protocol::StopMessage{});
  session_.Stop();
}

OperationResult LeaderNode::UpdateSchedule(cues::CueList cues) {
  cues::SortCues(cues);
  std::lock_guard<std::mutex> lock(control_mutex_);
  schedule_ = std::move(cues);
  if (!channel_.IsOpen()) {
    return OperationResult(true, "Schedule stored (" + std::to_string(schedule_.size()) +
                                     " cues); control channel closed");
  }
  if (!channel_.Broadcast(protocol::UpdateScheduleMessage{schedule_})) {
    return OperationResult(false, "Schedule stored but update could not be sent");
  }
  return OperationResult(true, "Schedule updated (" + std::to_string(schedule_.size()) + " cues)");
}

bool LeaderNode::SendCommandTo(const std::string& collaborator_id,
                               const protocol::Message& message) {
  return channel_.SendTo(collaborator_id, message);
}

LeaderStatus LeaderNode::GetStatus() const {
  LeaderStatus status;
  {
    std::lock_guard<std::mutex> lock(control_mutex_);
    status.cue_count = schedule_.size();
  }
  status.running = session_.IsRunning();
  status.elapsed_s = status.running ? broadcaster_.CurrentTime() : 0.0;
  status.ticks_sent = broadcaster_.TicksSent();
  status.collaborators = registry_.Snapshot();
  for (const auto& entry : status.collaborators) {
    if (entry.second.online) ++status.online_count;
  }
  status.session = session_.Stats();
  return status;
}

}  // namespace kitchensync::runtime
