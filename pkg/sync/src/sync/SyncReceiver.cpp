// Repository: KitchenSync
// Component: Sync Receiver Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/sync/SyncReceiver.hpp"

#include <chrono>
#include <utility>
#include <variant>

#include "kitchensync/protocol/MessageCodec.hpp"
#include "kitchensync/util/Logger.hpp"

namespace kitchensync::sync {

using util::Logger;

SyncReceiver::SyncReceiver(SyncReceiverConfig config, std::shared_ptr<timing::MasterClock> clock,
                           net::TransportFactory transport_factory, TickBus& bus)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      transport_factory_(std::move(transport_factory)),
      bus_(bus),
      task_("SyncReceiver") {}

SyncReceiver::~SyncReceiver() { Stop(); }

void SyncReceiver::Start() {
  if (running_.load(std::memory_order_acquire)) return;

  transport_ = transport_factory_(
      net::TransportSpec{config_.bind_address, config_.sync_port, true});
  running_.store(true, std::memory_order_release);
  task_.Start([this](const runtime::StopToken& token) { Loop(token); });
  Logger::Info("[SyncReceiver] Listening for clock ticks on port " +
               std::to_string(config_.sync_port));
}

void SyncReceiver::Stop() {
  const bool was_running = running_.exchange(false, std::memory_order_acq_rel);
  task_.RequestStop();
  if (transport_) transport_->Close();
  task_.Join();
  transport_.reset();
  if (was_running) {
    Logger::Info("[SyncReceiver] Stopped after " + std::to_string(TicksReceived()) + " ticks");
  }
}

bool SyncReceiver::HandleDatagram(const std::string& payload) {
  auto decoded = protocol::MessageCodec::Decode(payload);
  if (!decoded) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  const auto* sync = std::get_if<protocol::SyncMessage>(&decoded->message);
  if (!sync) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    Logger::Debug(std::string("[SyncReceiver] Ignoring ") +
                  protocol::MessageTypeName(protocol::TypeOf(decoded->message)) +
                  " on clock channel");
    return false;
  }

  SyncTick tick{sync->time, clock_->now_monotonic_s(), sync->leader_id};
  {
    std::lock_guard<std::mutex> lock(leader_mutex_);
    last_leader_id_ = sync->leader_id;
  }
  bus_.Publish(tick);
  // Counted once every subscriber has seen the tick.
  ticks_received_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

std::optional<std::string> SyncReceiver::LastLeaderId() const {
  std::lock_guard<std::mutex> lock(leader_mutex_);
  return last_leader_id_;
}

void SyncReceiver::Loop(const runtime::StopToken& token) {
  const auto timeout = std::chrono::milliseconds(
      static_cast<int64_t>(config_.poll_interval_s * 1000.0));
  while (!token.StopRequested()) {
    auto dgram = transport_->Receive(timeout);
    if (!dgram) continue;
    HandleDatagram(dgram->payload);
  }
}

}  // namespace kitchensync::sync
