// Contract Tests: CollaboratorRegistry
// Upsert registration, heartbeat-only refresh, derived liveness, eviction.

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "kitchensync/leader/CollaboratorRegistry.hpp"
#include "../../fixtures/FakeMasterClock.h"

namespace kitchensync::tests {

using leader::CollaboratorRegistry;
using leader::RegistryConfig;

class CollaboratorRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<fixtures::FakeMasterClock>();
    registry_ = std::make_unique<CollaboratorRegistry>(RegistryConfig(), clock_);
  }

  net::Endpoint Addr(const std::string& host) { return net::Endpoint{host, 41000}; }

  std::shared_ptr<fixtures::FakeMasterClock> clock_;
  std::unique_ptr<CollaboratorRegistry> registry_;
};

// ============================================================================
// Registration
// ============================================================================

TEST_F(CollaboratorRegistryTest, RegisterInsertsThenUpserts) {
  EXPECT_TRUE(registry_->Register("pi-1", Addr("10.0.0.5"), "ready", "clip_a.mp4"));
  const double first_seen = clock_->now_monotonic_s();

  clock_->AdvanceSeconds(2.0);
  EXPECT_FALSE(registry_->Register("pi-1", Addr("10.0.0.9"), "ready", "clip_b.mp4"));

  auto snapshot = registry_->Snapshot();
  ASSERT_EQ(snapshot.size(), 1u);
  const auto& record = snapshot.at("pi-1").record;
  EXPECT_EQ(record.address.host, "10.0.0.9");
  EXPECT_EQ(record.media_ref, "clip_b.mp4");
  EXPECT_DOUBLE_EQ(record.registered_at, first_seen) << "registered_at set on insert only";
  EXPECT_DOUBLE_EQ(record.last_seen, first_seen + 2.0);
}

TEST_F(CollaboratorRegistryTest, HeartbeatForUnknownIdIsNoOp) {
  EXPECT_FALSE(registry_->Heartbeat("ghost", "ready"));
  EXPECT_EQ(registry_->Count(), 0u);
}

TEST_F(CollaboratorRegistryTest, HeartbeatRefreshesLastSeenAndStatus) {
  registry_->Register("pi-1", Addr("10.0.0.5"), "ready", "");
  clock_->AdvanceSeconds(8.0);
  EXPECT_TRUE(registry_->Heartbeat("pi-1", "running"));

  auto view = registry_->Snapshot().at("pi-1");
  EXPECT_EQ(view.record.status, "running");
  EXPECT_DOUBLE_EQ(view.seconds_since_seen, 0.0);
}

TEST_F(CollaboratorRegistryTest, UpdateStatusTouchesKnownEntriesOnly) {
  EXPECT_FALSE(registry_->UpdateStatus("ghost", "running"));
  registry_->Register("pi-1", Addr("10.0.0.5"), "ready", "");
  EXPECT_TRUE(registry_->UpdateStatus("pi-1", "sync lost"));
  EXPECT_EQ(registry_->Snapshot().at("pi-1").record.status, "sync lost");
}

TEST_F(CollaboratorRegistryTest, RemoveDropsEntry) {
  registry_->Register("pi-1", Addr("10.0.0.5"), "ready", "");
  EXPECT_TRUE(registry_->Remove("pi-1"));
  EXPECT_FALSE(registry_->Remove("pi-1"));
  EXPECT_FALSE(registry_->AddressOf("pi-1").has_value());
}

// ============================================================================
// Liveness and eviction
// ============================================================================

TEST_F(CollaboratorRegistryTest, OnlineIffSeenWithinTimeout) {
  registry_->Register("pi-1", Addr("10.0.0.5"), "ready", "");

  clock_->AdvanceSeconds(9.9);
  EXPECT_TRUE(registry_->Snapshot().at("pi-1").online);
  EXPECT_EQ(registry_->OnlineCount(), 1u);

  clock_->AdvanceSeconds(0.1);
  EXPECT_FALSE(registry_->Snapshot().at("pi-1").online) << "age == timeout is offline";
  EXPECT_EQ(registry_->OnlineCount(), 0u);
  EXPECT_EQ(registry_->Count(), 1u) << "offline entries are retained";
}

TEST_F(CollaboratorRegistryTest, SnapshotDoesNotMutate) {
  registry_->Register("pi-1", Addr("10.0.0.5"), "ready", "");
  clock_->AdvanceSeconds(100.0);
  registry_->Snapshot();
  registry_->Snapshot();
  EXPECT_EQ(registry_->Count(), 1u);
}

TEST_F(CollaboratorRegistryTest, EvictOnlyAfterThreeTimesTimeout) {
  registry_->Register("old", Addr("10.0.0.5"), "ready", "");
  clock_->AdvanceSeconds(25.0);
  registry_->Register("new", Addr("10.0.0.6"), "ready", "");

  clock_->AdvanceSeconds(5.0);  // old: 30s exactly
  EXPECT_TRUE(registry_->EvictStale().empty()) << "30s is not beyond 3 x 10s";

  clock_->AdvanceSeconds(0.5);
  EXPECT_EQ(registry_->EvictStale(), (std::vector<std::string>{"old"}));
  EXPECT_EQ(registry_->Count(), 1u);
  EXPECT_TRUE(registry_->AddressOf("new").has_value());
}

TEST_F(CollaboratorRegistryTest, CustomTimeoutIsHonoured) {
  RegistryConfig config;
  config.liveness_timeout_s = 2.0;
  config.eviction_factor = 2.0;
  CollaboratorRegistry registry(config, clock_);
  registry.Register("pi-1", Addr("10.0.0.5"), "ready", "");

  clock_->AdvanceSeconds(3.0);
  EXPECT_EQ(registry.OnlineCount(), 0u);
  EXPECT_TRUE(registry.EvictStale().empty());
  clock_->AdvanceSeconds(1.5);
  EXPECT_EQ(registry.EvictStale().size(), 1u);
}

}  // namespace kitchensync::tests
