// Repository: KitchenSync
// Component: Collaborator Registry Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/leader/CollaboratorRegistry.hpp"

#include <utility>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::leader {

using util::Logger;

CollaboratorRegistry::CollaboratorRegistry(RegistryConfig config,
                                           std::shared_ptr<timing::MasterClock> clock)
    : config_(config), clock_(std::move(clock)) {}

bool CollaboratorRegistry::Register(const std::string& id, const net::Endpoint& address,
                                    const std::string& status, const std::string& media_ref) {
  const double now = clock_->now_monotonic_s();
  bool inserted = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
      CollaboratorRecord record;
      record.id = id;
      record.registered_at = now;
      it = records_.emplace(id, std::move(record)).first;
      inserted = true;
    }
    CollaboratorRecord& record = it->second;
    record.address = address;
    record.status = status;
    record.media_ref = media_ref;
    record.last_seen = now;
  }
  if (inserted) {
    Logger::Info("[CollaboratorRegistry] Registered " + id + " at " + address.ToString() +
                 (media_ref.empty() ? "" : " (" + media_ref + ")"));
  } else {
    Logger::Debug("[CollaboratorRegistry] Re-registered " + id);
  }
  return inserted;
}

bool CollaboratorRegistry::Heartbeat(const std::string& id, const std::string& status) {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) return false;
  it->second.last_seen = now;
  it->second.status = status;
  return true;
}

bool CollaboratorRegistry::UpdateStatus(const std::string& id, const std::string& status) {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) return false;
  it->second.status = status;
  it->second.last_seen = now;
  return true;
}

bool CollaboratorRegistry::Remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.erase(id) > 0;
}

std::map<std::string, CollaboratorView> CollaboratorRegistry::Snapshot() const {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, CollaboratorView> out;
  for (const auto& [id, record] : records_) {
    CollaboratorView view;
    view.record = record;
    view.seconds_since_seen = now - record.last_seen;
    view.online = view.seconds_since_seen < config_.liveness_timeout_s;
    out.emplace(id, std::move(view));
  }
  return out;
}

std::vector<std::string> CollaboratorRegistry::EvictStale() {
  const double now = clock_->now_monotonic_s();
  const double limit = config_.liveness_timeout_s * config_.eviction_factor;
  std::vector<std::string> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
      if (now - it->second.last_seen > limit) {
        removed.push_back(it->first);
        it = records_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& id : removed) {
    Logger::Info("[CollaboratorRegistry] Evicted stale collaborator " + id);
  }
  return removed;
}

size_t CollaboratorRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

size_t CollaboratorRegistry::OnlineCount() const {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t online = 0;
  for (const auto& entry : records_) {
    if (now - entry.second.last_seen < config_.liveness_timeout_s) ++online;
  }
  return online;
}

std::optional<net::Endpoint> CollaboratorRegistry::AddressOf(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) return std::nullopt;
  return it->second.address;
}

}  // namespace kitchensync::leader
