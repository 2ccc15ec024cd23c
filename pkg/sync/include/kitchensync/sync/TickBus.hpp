// Repository: KitchenSync
// Component: Tick Bus
// Purpose: Dispatches each received clock tick to ordered, independent subscribers.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_SYNC_TICK_BUS_HPP_
#define KITCHENSYNC_SYNC_TICK_BUS_HPP_

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace kitchensync::sync {

// One received clock tick.
struct SyncTick {
  double leader_time = 0.0;   // leader elapsed seconds carried by the tick
  double receipt_time = 0.0;  // local monotonic seconds at receipt
  std::string leader_id;
};

// TickBus delivers every published tick to all subscribers in subscription
// order. A subscriber that throws std::exception is logged and skipped; the
// rest still run. Handlers run on the publishing thread, outside the bus lock,
// so a handler may subscribe or unsubscribe without deadlocking.
class TickBus {
 public:
  using Handler = std::function<void(const SyncTick&)>;
  using SubscriptionId = uint64_t;

  SubscriptionId Subscribe(std::string name, Handler handler);
  bool Unsubscribe(SubscriptionId id);

  void Publish(const SyncTick& tick);

  size_t SubscriberCount() const;
  uint64_t PublishedCount() const;
  uint64_t HandlerFailures() const;

 private:
  struct Subscriber {
    SubscriptionId id;
    std::string name;
    Handler handler;
  };

  mutable std::mutex mutex_;
  std::vector<Subscriber> subscribers_;
  SubscriptionId next_id_ = 1;
  uint64_t published_ = 0;
  uint64_t handler_failures_ = 0;
};

}  // namespace kitchensync::sync

#endif  // KITCHENSYNC_SYNC_TICK_BUS_HPP_
