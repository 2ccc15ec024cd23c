// Repository: KitchenSync
// Component: Sync Receiver
// Purpose: Collaborator-side clock channel listener feeding the tick bus.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_SYNC_SYNC_RECEIVER_HPP_
#define KITCHENSYNC_SYNC_SYNC_RECEIVER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/runtime/BackgroundTask.hpp"
#include "kitchensync/sync/ClockBroadcaster.hpp"
#include "kitchensync/sync/TickBus.hpp"
#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::sync {

struct SyncReceiverConfig {
  uint16_t sync_port = kDefaultSyncPort;
  std::string bind_address = net::kAnyAddress;
  // Upper bound on how long Stop() waits for the listener to notice.
  double poll_interval_s = 0.25;
};

// SyncReceiver binds the clock channel and publishes one SyncTick per valid
// `sync` datagram, stamped with the local monotonic receipt time.
//
// Malformed datagrams and non-sync bodies are dropped and counted.
class SyncReceiver {
 public:
  SyncReceiver(SyncReceiverConfig config, std::shared_ptr<timing::MasterClock> clock,
               net::TransportFactory transport_factory, TickBus& bus);
  ~SyncReceiver();

  SyncReceiver(const SyncReceiver&) = delete;
  SyncReceiver& operator=(const SyncReceiver&) = delete;

  // Binds the sync port and starts listening. Throws net::TransportError if
  // the port cannot be bound. No-op if already running.
  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Decodes one payload and publishes it if it is a tick. Returns true if a
  // tick was published. Called by the listener; exposed for tests.
  bool HandleDatagram(const std::string& payload);

  uint64_t TicksReceived() const { return ticks_received_.load(std::memory_order_relaxed); }
  uint64_t DatagramsDropped() const { return dropped_.load(std::memory_order_relaxed); }
  std::optional<std::string> LastLeaderId() const;

 private:
  void Loop(const runtime::StopToken& token);

  SyncReceiverConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  net::TransportFactory transport_factory_;
  TickBus& bus_;

  std::unique_ptr<net::IDatagramTransport> transport_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> ticks_received_{0};
  std::atomic<uint64_t> dropped_{0};

  mutable std::mutex leader_mutex_;
  std::optional<std::string> last_leader_id_;

  runtime::BackgroundTask task_;
};

}  // namespace kitchensync::sync

#endif  // KITCHENSYNC_SYNC_SYNC_RECEIVER_HPP_
