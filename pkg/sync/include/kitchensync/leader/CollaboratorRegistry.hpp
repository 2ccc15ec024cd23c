// Repository: KitchenSync
// Component: Collaborator Registry
// Purpose: Leader-side registration and heartbeat liveness of collaborators.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_LEADER_COLLABORATOR_REGISTRY_HPP_
#define KITCHENSYNC_LEADER_COLLABORATOR_REGISTRY_HPP_

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::leader {

struct RegistryConfig {
  double liveness_timeout_s = 10.0;
  // Entries silent for longer than this multiple of the timeout are evicted.
  double eviction_factor = 3.0;
};

struct CollaboratorRecord {
  std::string id;
  net::Endpoint address;
  std::string status;
  std::string media_ref;
  double last_seen = 0.0;      // monotonic seconds
  double registered_at = 0.0;  // monotonic seconds
};

struct CollaboratorView {
  CollaboratorRecord record;
  bool online = false;
  double seconds_since_seen = 0.0;
};

// CollaboratorRegistry
//
// Register() upserts: registered_at is set on first insertion only, last_seen
// is always refreshed. Heartbeat() and UpdateStatus() touch existing entries
// only; a heartbeat never registers implicitly.
//
// Online iff (now - last_seen) < liveness_timeout. EvictStale() removes an
// entry iff (now - last_seen) > eviction_factor * liveness_timeout; it is
// meant for a periodic background task, not per message.
class CollaboratorRegistry {
 public:
  CollaboratorRegistry(RegistryConfig config, std::shared_ptr<timing::MasterClock> clock);

  CollaboratorRegistry(const CollaboratorRegistry&) = delete;
  CollaboratorRegistry& operator=(const CollaboratorRegistry&) = delete;

  // Returns true if this was a new registration.
  bool Register(const std::string& id, const net::Endpoint& address, const std::string& status,
                const std::string& media_ref);

  // Returns false (no-op) if `id` is not registered.
  bool Heartbeat(const std::string& id, const std::string& status);
  bool UpdateStatus(const std::string& id, const std::string& status);

  bool Remove(const std::string& id);

  // Read-only view with derived liveness; does not mutate.
  std::map<std::string, CollaboratorView> Snapshot() const;

  // Returns the ids removed.
  std::vector<std::string> EvictStale();

  size_t Count() const;
  size_t OnlineCount() const;
  std::optional<net::Endpoint> AddressOf(const std::string& id) const;

  const RegistryConfig& config() const { return config_; }

 private:
  RegistryConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;

  mutable std::mutex mutex_;
  std::map<std::string, CollaboratorRecord> records_;
};

}  // namespace kitchensync::leader

#endif  // KITCHENSYNC_LEADER_COLLABORATOR_REGISTRY_HPP_
