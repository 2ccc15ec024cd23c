// Repository: KitchenSync
// Component: Clock Broadcaster Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/sync/ClockBroadcaster.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <utility>

#include "kitchensync/protocol/MessageCodec.hpp"
#include "kitchensync/util/Logger.hpp"

namespace kitchensync::sync {

using util::Logger;

double ClockBroadcaster::ClampTickInterval(double seconds) {
  if (!std::isfinite(seconds)) return kMinTickIntervalS;
  return std::clamp(seconds, kMinTickIntervalS, kMaxTickIntervalS);
}

ClockBroadcaster::ClockBroadcaster(ClockBroadcasterConfig config,
                                   std::shared_ptr<timing::MasterClock> clock,
                                   net::TransportFactory transport_factory)
    : config_(std::move(config)),
      tick_interval_s_(ClampTickInterval(config_.tick_interval_s)),
      clock_(std::move(clock)),
      transport_factory_(std::move(transport_factory)),
      task_("ClockBroadcaster") {
  if (tick_interval_s_ != config_.tick_interval_s) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "[ClockBroadcaster] Tick interval %.3fs clamped to %.3fs",
                  config_.tick_interval_s, tick_interval_s_);
    Logger::Warn(buf);
  }
}

ClockBroadcaster::~ClockBroadcaster() { Stop(); }

void ClockBroadcaster::Start(double epoch_monotonic_s, PositionSource position_source) {
  if (running_.load(std::memory_order_acquire)) return;

  // Throws TransportError; nothing has been mutated yet.
  auto transport = transport_factory_(net::TransportSpec{net::kAnyAddress, 0, true});

  {
    std::lock_guard<std::mutex> lock(mutex_);
    transport_ = std::move(transport);
    epoch_s_ = epoch_monotonic_s;
    position_source_ = std::move(position_source);
  }
  running_.store(true, std::memory_order_release);
  task_.Start([this](const runtime::StopToken& token) { Loop(token); });

  char buf[160];
  std::snprintf(buf, sizeof(buf), "[ClockBroadcaster] Broadcasting to %s:%u every %.3fs",
                config_.broadcast_address.c_str(), static_cast<unsigned>(config_.sync_port),
                tick_interval_s_);
  Logger::Info(buf);
}

void ClockBroadcaster::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    task_.Stop();
    return;
  }
  task_.Stop();

  std::unique_ptr<net::IDatagramTransport> transport;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    transport = std::move(transport_);
    position_source_ = nullptr;
  }
  if (transport) transport->Close();
  Logger::Info("[ClockBroadcaster] Stopped after " + std::to_string(TicksSent()) + " ticks");
}

double ClockBroadcaster::CurrentTime() const {
  PositionSource source;
  double epoch = 0.0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load(std::memory_order_acquire)) return 0.0;
    source = position_source_;
    epoch = epoch_s_;
  }
  if (source) {
    if (auto position = source()) return *position;
  }
  return clock_->now_monotonic_s() - epoch;
}

bool ClockBroadcaster::SendTick() {
  if (!running_.load(std::memory_order_acquire)) return false;

  protocol::SyncMessage tick{CurrentTime(), config_.leader_id};
  auto payload = protocol::MessageCodec::Encode(tick, clock_->now_utc_s());

  bool ok = false;
  if (payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transport_) {
      ok = transport_->Send(*payload,
                            net::Endpoint{config_.broadcast_address, config_.sync_port});
    }
  }

  if (ok) {
    ticks_sent_.fetch_add(1, std::memory_order_relaxed);
  } else {
    const uint64_t errors = send_errors_.fetch_add(1, std::memory_order_relaxed) + 1;
    // First failure and then every 100th, so a dead link does not flood the log.
    if (errors == 1 || errors % 100 == 0) {
      Logger::Warn("[ClockBroadcaster] Tick send failed (errors=" + std::to_string(errors) +
                   ")");
    }
  }
  return ok;
}

void ClockBroadcaster::Loop(const runtime::StopToken& token) {
  const auto interval = std::chrono::duration<double>(tick_interval_s_);
  while (!token.StopRequested()) {
    SendTick();
    if (token.WaitFor(interval)) break;
  }
}

}  // namespace kitchensync::sync
