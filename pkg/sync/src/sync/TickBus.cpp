// Repository: KitchenSync
// Component: Tick Bus Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/sync/TickBus.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::sync {

using util::Logger;

TickBus::SubscriptionId TickBus::Subscribe(std::string name, Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.push_back(Subscriber{id, std::move(name), std::move(handler)});
  return id;
}

bool TickBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const Subscriber& s) { return s.id == id; });
  if (it == subscribers_.end()) return false;
  subscribers_.erase(it);
  return true;
}

void TickBus::Publish(const SyncTick& tick) {
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++published_;
    snapshot = subscribers_;
  }

  uint64_t failures = 0;
  for (const auto& sub : snapshot) {
    try {
      sub.handler(tick);
    } catch (const std::exception& e) {
      ++failures;
      Logger::Error("[TickBus] Subscriber '" + sub.name + "' failed: " + e.what());
    }
  }
  if (failures > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_failures_ += failures;
  }
}

size_t TickBus::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

uint64_t TickBus::PublishedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return published_;
}

uint64_t TickBus::HandlerFailures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handler_failures_;
}

}  // namespace kitchensync::sync
