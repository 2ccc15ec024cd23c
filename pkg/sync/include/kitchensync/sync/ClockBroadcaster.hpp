// Repository: KitchenSync
// Component: Clock Broadcaster
// Purpose: Leader-side periodic broadcast of the session clock.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_SYNC_CLOCK_BROADCASTER_HPP_
#define KITCHENSYNC_SYNC_CLOCK_BROADCASTER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/runtime/BackgroundTask.hpp"
#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::sync {

inline constexpr double kMinTickIntervalS = 0.02;
inline constexpr double kMaxTickIntervalS = 5.0;
inline constexpr uint16_t kDefaultSyncPort = 5005;

struct ClockBroadcasterConfig {
  double tick_interval_s = 0.1;  // clamped to [0.02, 5.0]
  uint16_t sync_port = kDefaultSyncPort;
  std::string broadcast_address = net::kDefaultBroadcastAddress;
  std::string leader_id = "leader-001";
};

// ClockBroadcaster emits {sync, time, leader_id} once per tick interval.
//
// time = now - epoch on the monotonic clock, unless a position source is
// supplied and currently reports a value (live media position), in which case
// that value is sent instead.
//
// Delivery is at most once and lossy: a dropped tick is superseded by the next
// one, so there is no retry. Send failures are logged and counted; they never
// end the loop. Only Stop() does.
class ClockBroadcaster {
 public:
  using PositionSource = std::function<std::optional<double>()>;

  ClockBroadcaster(ClockBroadcasterConfig config,
                   std::shared_ptr<timing::MasterClock> clock,
                   net::TransportFactory transport_factory);
  ~ClockBroadcaster();

  ClockBroadcaster(const ClockBroadcaster&) = delete;
  ClockBroadcaster& operator=(const ClockBroadcaster&) = delete;

  // Opens the send socket and starts the tick loop. No-op if already running.
  // Throws net::TransportError if the socket cannot be opened; the
  // broadcaster is then left stopped.
  void Start(double epoch_monotonic_s, PositionSource position_source = nullptr);

  // Stops the loop, joins it and releases the socket. Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Computes and sends one tick. Called by the loop; exposed for tests.
  // Returns false if not running or the send failed.
  bool SendTick();

  // Session time the next tick would carry (0 when stopped).
  double CurrentTime() const;

  double tick_interval_s() const { return tick_interval_s_; }
  uint64_t TicksSent() const { return ticks_sent_.load(std::memory_order_relaxed); }
  uint64_t SendErrors() const { return send_errors_.load(std::memory_order_relaxed); }

  static double ClampTickInterval(double seconds);

 private:
  void Loop(const runtime::StopToken& token);

  ClockBroadcasterConfig config_;
  const double tick_interval_s_;
  std::shared_ptr<timing::MasterClock> clock_;
  net::TransportFactory transport_factory_;

  mutable std::mutex mutex_;
  std::unique_ptr<net::IDatagramTransport> transport_;
  double epoch_s_ = 0.0;
  PositionSource position_source_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> ticks_sent_{0};
  std::atomic<uint64_t> send_errors_{0};

  runtime::BackgroundTask task_;
};

}  // namespace kitchensync::sync

#endif  // KITCHENSYNC_SYNC_CLOCK_BROADCASTER_HPP_
