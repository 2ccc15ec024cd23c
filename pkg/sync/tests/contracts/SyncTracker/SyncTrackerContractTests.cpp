// Contract Tests: SyncTracker and TickBus
// Drift estimation relative to the previous sample, quality classification,
// synced window, and ordered tick fan-out.

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "kitchensync/sync/SyncTracker.hpp"
#include "kitchensync/sync/TickBus.hpp"
#include "kitchensync/util/Logger.hpp"
#include "../../fixtures/FakeMasterClock.h"

namespace kitchensync::tests {

using sync::SyncQuality;
using sync::SyncTracker;

class SyncTrackerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<fixtures::FakeMasterClock>();
    tracker_ = std::make_unique<SyncTracker>(clock_);
  }

  // Two samples one local second apart whose leader times differ by
  // 1 + drift, giving exactly one drift value of `drift`.
  void RecordPairWithDrift(double drift) {
    tracker_->RecordSync(0.0, 100.0);
    tracker_->RecordSync(1.0 + drift, 101.0);
  }

  std::shared_ptr<fixtures::FakeMasterClock> clock_;
  std::unique_ptr<SyncTracker> tracker_;
};

// ============================================================================
// Drift
// ============================================================================

TEST_F(SyncTrackerTest, FirstSampleProducesNoDrift) {
  tracker_->RecordSync(5.0, 100.0);
  auto stats = tracker_->Stats();
  EXPECT_EQ(stats.sample_count, 1u);
  EXPECT_EQ(stats.drift_count, 0u);
  EXPECT_DOUBLE_EQ(tracker_->AverageDrift(), 0.0);
}

TEST_F(SyncTrackerTest, DriftIsRelativeToPreviousSample) {
  tracker_->RecordSync(0.0, 100.0);
  tracker_->RecordSync(1.0, 101.05);  // arrived 50ms late
  EXPECT_NEAR(tracker_->AverageDrift(), -0.05, 1e-9);
}

TEST_F(SyncTrackerTest, PerfectTicksAverageToZero) {
  for (int i = 0; i < 20; ++i) {
    tracker_->RecordSync(i * 0.1, 100.0 + i * 0.1);
  }
  EXPECT_NEAR(tracker_->AverageDrift(), 0.0, 1e-9);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kExcellent);
}

TEST_F(SyncTrackerTest, AverageIsMeanOfDriftWindow) {
  tracker_->RecordSync(0.0, 100.0);
  tracker_->RecordSync(1.2, 101.0);  // +0.2
  tracker_->RecordSync(2.0, 102.0);  // -0.2
  tracker_->RecordSync(3.3, 103.0);  // +0.3
  EXPECT_NEAR(tracker_->AverageDrift(), 0.1, 1e-9);
}

TEST_F(SyncTrackerTest, NonFiniteSampleIsIgnored) {
  RecordPairWithDrift(0.0);
  tracker_->RecordSync(std::numeric_limits<double>::quiet_NaN(), 102.0);
  tracker_->RecordSync(std::numeric_limits<double>::infinity(), 102.0);

  auto stats = tracker_->Stats();
  EXPECT_EQ(stats.sample_count, 2u);
  EXPECT_EQ(stats.drift_count, 1u);
  EXPECT_NEAR(tracker_->AverageDrift(), 0.0, 1e-9);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kExcellent);
}

TEST_F(SyncTrackerTest, WindowsAreBounded) {
  SyncTracker tracker(clock_, 4);
  for (int i = 0; i < 10; ++i) {
    tracker.RecordSync(i, 100.0 + i);
  }
  auto stats = tracker.Stats();
  EXPECT_EQ(stats.sample_count, 4u);
  EXPECT_EQ(stats.drift_count, 4u);
}

TEST_F(SyncTrackerTest, OldDriftLeavesTheWindow) {
  SyncTracker tracker(clock_, 2);
  tracker.RecordSync(0.0, 100.0);
  tracker.RecordSync(3.0, 101.0);  // +2.0
  tracker.RecordSync(4.0, 102.0);  // 0
  tracker.RecordSync(5.0, 103.0);  // 0, the +2.0 drops out
  EXPECT_NEAR(tracker.AverageDrift(), 0.0, 1e-9);
}

// ============================================================================
// Quality
// ============================================================================

TEST_F(SyncTrackerTest, NoSamplesIsNoData) {
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kNoData);
  EXPECT_FALSE(tracker_->Stats().seconds_since_last_sample.has_value());
}

TEST_F(SyncTrackerTest, QualityFollowsDriftThresholds) {
  RecordPairWithDrift(0.05);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kExcellent);

  tracker_->Reset();
  tracker_->RecordSync(0.0, 100.0);
  tracker_->RecordSync(0.1, 100.0);  // drift of exactly 0.1
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kGood) << "0.1 is not below 0.1";

  tracker_->Reset();
  RecordPairWithDrift(0.3);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kGood);

  tracker_->Reset();
  RecordPairWithDrift(0.5);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kFair) << "0.5 is not below 0.5";

  tracker_->Reset();
  RecordPairWithDrift(1.0);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kPoor) << "1.0 is not below 1.0";
}

TEST_F(SyncTrackerTest, NegativeDriftUsesMagnitude) {
  RecordPairWithDrift(-0.7);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kFair);
}

TEST_F(SyncTrackerTest, SilenceOverridesDrift) {
  RecordPairWithDrift(0.0);

  clock_->AdvanceSeconds(5.0);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kExcellent) << "5s silence is not degraded";

  clock_->AdvanceSeconds(0.5);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kDegraded);

  clock_->AdvanceSeconds(4.5);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kDegraded) << "10s silence is not lost";

  clock_->AdvanceSeconds(0.5);
  EXPECT_EQ(tracker_->Quality(), SyncQuality::kLost);
}

TEST_F(SyncTrackerTest, IsSyncedWithinTimeout) {
  EXPECT_FALSE(tracker_->IsSynced());

  tracker_->RecordSync(0.0, 100.0);
  EXPECT_TRUE(tracker_->IsSynced());

  clock_->AdvanceSeconds(4.9);
  EXPECT_TRUE(tracker_->IsSynced());

  clock_->AdvanceSeconds(0.1);
  EXPECT_FALSE(tracker_->IsSynced()) << "synced requires strictly less than the timeout";
  EXPECT_TRUE(tracker_->IsSynced(6.0));
}

TEST_F(SyncTrackerTest, ResetForgetsEverything) {
  RecordPairWithDrift(0.3);
  tracker_->Reset();
  auto stats = tracker_->Stats();
  EXPECT_EQ(stats.sample_count, 0u);
  EXPECT_EQ(stats.quality, SyncQuality::kNoData);
  EXPECT_FALSE(tracker_->LastSample().has_value());
}

TEST_F(SyncTrackerTest, QualityNamesAreStable) {
  EXPECT_STREQ(sync::SyncQualityName(SyncQuality::kNoData), "no_data");
  EXPECT_STREQ(sync::SyncQualityName(SyncQuality::kLost), "lost");
  EXPECT_STREQ(sync::SyncQualityName(SyncQuality::kExcellent), "excellent");
}

// ============================================================================
// TickBus
// ============================================================================

class TickBusTest : public ::testing::Test {
 protected:
  void TearDown() override { util::Logger::SetErrorSink(nullptr); }

  sync::TickBus bus_;
};

TEST_F(TickBusTest, SubscribersRunInSubscriptionOrder) {
  std::vector<std::string> order;
  bus_.Subscribe("a", [&](const sync::SyncTick&) { order.push_back("a"); });
  bus_.Subscribe("b", [&](const sync::SyncTick&) { order.push_back("b"); });
  bus_.Subscribe("c", [&](const sync::SyncTick&) { order.push_back("c"); });

  bus_.Publish(sync::SyncTick{1.0, 100.0, "leader-001"});
  EXPECT_EQ(order, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(bus_.PublishedCount(), 1u);
}

TEST_F(TickBusTest, ThrowingSubscriberDoesNotStarveOthers) {
  std::vector<std::string> errors;
  util::Logger::SetErrorSink([&](const std::string& line) { errors.push_back(line); });

  int later_calls = 0;
  bus_.Subscribe("broken", [](const sync::SyncTick&) {
    throw std::runtime_error("device unplugged");
  });
  bus_.Subscribe("later", [&](const sync::SyncTick&) { ++later_calls; });

  bus_.Publish(sync::SyncTick{});
  bus_.Publish(sync::SyncTick{});

  EXPECT_EQ(later_calls, 2);
  EXPECT_EQ(bus_.HandlerFailures(), 2u);
  ASSERT_FALSE(errors.empty());
  EXPECT_NE(errors.front().find("broken"), std::string::npos);
}

TEST_F(TickBusTest, UnsubscribedHandlerNoLongerRuns) {
  int calls = 0;
  auto id = bus_.Subscribe("x", [&](const sync::SyncTick&) { ++calls; });
  bus_.Publish(sync::SyncTick{});
  EXPECT_TRUE(bus_.Unsubscribe(id));
  EXPECT_FALSE(bus_.Unsubscribe(id));
  bus_.Publish(sync::SyncTick{});
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus_.SubscriberCount(), 0u);
}

TEST_F(TickBusTest, TickFieldsReachHandlers) {
  sync::SyncTick seen;
  bus_.Subscribe("x", [&](const sync::SyncTick& t) { seen = t; });
  bus_.Publish(sync::SyncTick{12.5, 300.25, "leader-xyz"});
  EXPECT_DOUBLE_EQ(seen.leader_time, 12.5);
  EXPECT_DOUBLE_EQ(seen.receipt_time, 300.25);
  EXPECT_EQ(seen.leader_id, "leader-xyz");
}

}  // namespace kitchensync::tests
