// Scenario Tests: LeaderNode and CollaboratorNode
// Session control, tick-driven cue firing, schedule updates, sync-loss
// watchdog and heartbeats, first on a single node and then end to end over
// the in-memory network.

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "kitchensync/protocol/MessageCodec.hpp"
#include "kitchensync/runtime/CollaboratorNode.hpp"
#include "kitchensync/runtime/LeaderNode.hpp"
#include "../../fixtures/Eventually.h"
#include "../../fixtures/FakeMasterClock.h"
#include "../../fixtures/FakeMediaPlayer.h"
#include "../../fixtures/LoopbackNetwork.h"
#include "../../fixtures/RecordingTriggerOutput.h"

namespace kitchensync::tests {

using runtime::CollaboratorConfig;
using runtime::CollaboratorNode;
using runtime::LeaderConfig;
using runtime::LeaderNode;

namespace {

cues::Cue NoteAt(double time, int32_t note = 60) {
  cues::Cue cue;
  cue.time = time;
  cue.note = note;
  cue.velocity = 127;
  return cue;
}

protocol::StartMessage StartWith(cues::CueList schedule) {
  protocol::StartMessage start;
  start.schedule = std::move(schedule);
  start.start_time = 1700000000.0;
  return start;
}

}  // namespace

// ============================================================================
// CollaboratorNode (driven directly, no transport)
// ============================================================================

class CollaboratorNodeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<fixtures::FakeMasterClock>();
    network_ = fixtures::LoopbackNetwork::Create();
    media_ = std::make_shared<fixtures::FakeMediaPlayer>();
    output_ = std::make_shared<fixtures::RecordingTriggerOutput>();
    node_ = std::make_unique<CollaboratorNode>(config_, clock_, network_->FactoryFor("10.0.0.2"),
                                               media_, output_);
  }

  void Tick(double leader_time) {
    node_->bus().Publish(sync::SyncTick{leader_time, clock_->now_monotonic_s(), "leader-001"});
  }

  CollaboratorConfig config_;
  std::shared_ptr<fixtures::FakeMasterClock> clock_;
  std::shared_ptr<fixtures::LoopbackNetwork> network_;
  std::shared_ptr<fixtures::FakeMediaPlayer> media_;
  std::shared_ptr<fixtures::RecordingTriggerOutput> output_;
  std::unique_ptr<CollaboratorNode> node_;
};

TEST_F(CollaboratorNodeTest, CueFiresOnTheFirstTickAtOrPastItsTime) {
  node_->HandleStart(StartWith({NoteAt(1.5)}));

  Tick(0.0);
  clock_->AdvanceSeconds(1.0);
  Tick(1.0);
  EXPECT_TRUE(output_->Sent().empty());

  clock_->AdvanceSeconds(1.0);
  Tick(2.0);
  EXPECT_EQ(output_->SentTimes(), (std::vector<double>{1.5}));

  clock_->AdvanceSeconds(1.0);
  Tick(3.0);
  EXPECT_EQ(output_->Sent().size(), 1u);
}

TEST_F(CollaboratorNodeTest, TicksUpdateSessionTimeAndTracker) {
  node_->HandleStart(StartWith({}));
  Tick(4.0);
  clock_->AdvanceSeconds(0.1);
  Tick(4.1);

  auto status = node_->GetStatus();
  EXPECT_TRUE(status.running);
  EXPECT_DOUBLE_EQ(status.session_time_s, 4.1);
  EXPECT_EQ(status.sync.sample_count, 2u);
  EXPECT_EQ(status.sync.quality, sync::SyncQuality::kExcellent);
}

TEST_F(CollaboratorNodeTest, StatusListsRecentAndUpcomingCues) {
  node_->HandleStart(StartWith({NoteAt(1.0), NoteAt(3.0), NoteAt(8.0), NoteAt(30.0)}));
  Tick(3.5);

  auto status = node_->GetStatus();
  std::vector<double> recent;
  for (const auto& cue : status.recent_cues) recent.push_back(cue.time);
  std::vector<double> upcoming;
  for (const auto& cue : status.upcoming_cues) upcoming.push_back(cue.time);
  EXPECT_EQ(recent, (std::vector<double>{1.0, 3.0}));
  EXPECT_EQ(upcoming, (std::vector<double>{8.0}));

  node_->HandleStop();
  status = node_->GetStatus();
  EXPECT_TRUE(status.recent_cues.empty());
  EXPECT_TRUE(status.upcoming_cues.empty());
}

TEST_F(CollaboratorNodeTest, NonFiniteTickLeavesSessionAndCuesUntouched) {
  node_->HandleStart(StartWith({NoteAt(10.0), NoteAt(20.0)}));
  Tick(0.5);
  clock_->AdvanceSeconds(0.5);
  Tick(std::numeric_limits<double>::quiet_NaN());

  auto status = node_->GetStatus();
  EXPECT_TRUE(output_->Sent().empty());
  EXPECT_DOUBLE_EQ(status.session_time_s, 0.5);
  EXPECT_EQ(status.sync.sample_count, 1u);

  clock_->AdvanceSeconds(0.5);
  Tick(11.0);
  EXPECT_EQ(output_->SentTimes(), (std::vector<double>{10.0}));
}

TEST_F(CollaboratorNodeTest, NoCuesFireWithoutASession) {
  Tick(10.0);
  EXPECT_TRUE(output_->Sent().empty());
  EXPECT_EQ(node_->GetStatus().sync.sample_count, 1u) << "tracker still records the tick";
}

TEST_F(CollaboratorNodeTest, StartWhileRunningRestartsThePass) {
  node_->HandleStart(StartWith({NoteAt(1.0)}));
  Tick(2.0);
  node_->HandleStart(StartWith({NoteAt(1.0)}));
  Tick(2.0);
  EXPECT_EQ(output_->Sent().size(), 2u);
  EXPECT_EQ(media_->StopCalls(), 1);
  EXPECT_EQ(media_->PlayCalls(), 2);
}

TEST_F(CollaboratorNodeTest, StopHaltsCuesAndMedia) {
  node_->HandleStart(StartWith({NoteAt(1.0), NoteAt(5.0)}));
  Tick(2.0);
  node_->HandleStop();
  Tick(6.0);

  EXPECT_EQ(output_->Sent().size(), 1u);
  EXPECT_FALSE(node_->IsRunning());
  EXPECT_FALSE(media_->IsPlaying());

  node_->HandleStop();
  EXPECT_EQ(media_->StopCalls(), 1) << "stop while stopped is a no-op";
}

TEST_F(CollaboratorNodeTest, MidSessionUpdateDoesNotReplayPastCues) {
  node_->HandleStart(StartWith({NoteAt(1.0)}));
  Tick(2.0);

  node_->HandleUpdateSchedule(protocol::UpdateScheduleMessage{{NoteAt(1.5, 70), NoteAt(3.0, 71)}});
  Tick(3.0);

  auto sent = output_->Sent();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[1].note, 71);
}

TEST_F(CollaboratorNodeTest, WatchdogStopsSessionAfterSilence) {
  node_->HandleStart(StartWith({}));
  clock_->AdvanceSeconds(4.9);
  EXPECT_FALSE(node_->CheckSyncLoss());

  Tick(4.9);
  clock_->AdvanceSeconds(4.9);
  EXPECT_FALSE(node_->CheckSyncLoss()) << "the last tick resets the silence window";

  clock_->AdvanceSeconds(0.2);
  EXPECT_TRUE(node_->CheckSyncLoss());
  EXPECT_FALSE(node_->IsRunning());
  EXPECT_EQ(node_->GetStatus().sync_losses, 1u);
  EXPECT_FALSE(node_->CheckSyncLoss());
}

TEST_F(CollaboratorNodeTest, HeartbeatsAreRateLimited) {
  node_->channel().Open();
  EXPECT_TRUE(node_->SendHeartbeat());
  EXPECT_FALSE(node_->SendHeartbeat());
  clock_->AdvanceSeconds(0.99);
  EXPECT_FALSE(node_->SendHeartbeat());
  clock_->AdvanceSeconds(0.01);
  EXPECT_TRUE(node_->SendHeartbeat());
  EXPECT_EQ(node_->GetStatus().heartbeats_sent, 2u);
}

TEST_F(CollaboratorNodeTest, DriftingMediaIsCorrectedWhilePlaying) {
  media_->SetReportedPosition(0.0);
  node_->HandleStart(StartWith({}));
  for (int i = 0; i < 5; ++i) {
    media_->SetReportedPosition(10.0 + i + 2.0);
    Tick(10.0 + i);
  }
  auto seeks = media_->Seeks();
  ASSERT_EQ(seeks.size(), 1u);
  EXPECT_DOUBLE_EQ(seeks[0], 14.0);
}

// ============================================================================
// LeaderNode (driven directly)
// ============================================================================

class LeaderNodeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<fixtures::FakeMasterClock>();
    network_ = fixtures::LoopbackNetwork::Create();
    config_.broadcaster.tick_interval_s = sync::kMaxTickIntervalS;
    config_.control.poll_interval_s = 0.02;
    node_ = std::make_unique<LeaderNode>(config_, clock_, network_->FactoryFor("10.0.0.1"),
                                         nullptr);
  }

  LeaderConfig config_;
  std::shared_ptr<fixtures::FakeMasterClock> clock_;
  std::shared_ptr<fixtures::LoopbackNetwork> network_;
  std::unique_ptr<LeaderNode> node_;
};

TEST_F(LeaderNodeTest, StartBroadcastsScheduleAndRefusesDoubleStart) {
  node_->channel().Open();
  node_->LoadSchedule({NoteAt(2.0), NoteAt(1.0)});

  auto first = node_->StartSession();
  EXPECT_TRUE(first.success);
  auto second = node_->StartSession();
  EXPECT_FALSE(second.success);
  EXPECT_EQ(second.message, "Session already running");

  auto sent = network_->SentToPort(config_.control.control_port);
  ASSERT_EQ(sent.size(), 1u);
  auto decoded = protocol::MessageCodec::Decode(sent[0].payload);
  ASSERT_TRUE(decoded.has_value());
  const auto& start = std::get<protocol::StartMessage>(decoded->message);
  ASSERT_EQ(start.schedule.size(), 2u);
  EXPECT_DOUBLE_EQ(start.schedule[0].time, 1.0);
  EXPECT_DOUBLE_EQ(start.start_time, clock_->now_utc_s());
}

TEST_F(LeaderNodeTest, StopRequiresARunningSession) {
  node_->channel().Open();
  auto refused = node_->StopSession();
  EXPECT_FALSE(refused.success);
  EXPECT_EQ(refused.message, "Session not running");

  ASSERT_TRUE(node_->StartSession().success);
  clock_->AdvanceSeconds(3.0);
  EXPECT_TRUE(node_->StopSession().success);
  EXPECT_FALSE(node_->broadcaster().IsRunning());

  auto status = node_->GetStatus();
  EXPECT_FALSE(status.running);
  EXPECT_EQ(status.session.sessions_started, 1u);
  EXPECT_DOUBLE_EQ(status.session.last_session_duration_s, 3.0);
}

TEST_F(LeaderNodeTest, ElapsedTimeComesFromTheBroadcaster) {
  ASSERT_TRUE(node_->StartSession().success);
  clock_->AdvanceSeconds(12.0);
  EXPECT_DOUBLE_EQ(node_->GetStatus().elapsed_s, 12.0);
}

TEST_F(LeaderNodeTest, UpdateScheduleBroadcastsOnlyWhenChannelOpen) {
  auto closed = node_->UpdateSchedule({NoteAt(1.0)});
  EXPECT_TRUE(closed.success);
  EXPECT_TRUE(network_->Sent().empty());

  node_->channel().Open();
  EXPECT_TRUE(node_->UpdateSchedule({NoteAt(1.0), NoteAt(2.0)}).success);
  auto sent = network_->SentToPort(config_.control.control_port);
  ASSERT_EQ(sent.size(), 1u);
  auto decoded = protocol::MessageCodec::Decode(sent[0].payload);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(protocol::TypeOf(decoded->message), protocol::MessageType::kUpdateSchedule);
  EXPECT_EQ(node_->GetStatus().cue_count, 2u);
}

TEST_F(LeaderNodeTest, RegistrationUsesSourceAddress) {
  const net::Endpoint from{"10.0.0.42", 5006};
  node_->channel().Dispatch(
      *protocol::MessageCodec::Encode(protocol::RegisterMessage{"pi-1", "ready", "a.mp4"}, 0.0),
      from);
  node_->channel().Dispatch(
      *protocol::MessageCodec::Encode(protocol::HeartbeatMessage{"pi-ghost", "ready"}, 0.0), from);

  auto status = node_->GetStatus();
  ASSERT_EQ(status.collaborators.size(), 1u);
  EXPECT_EQ(status.collaborators.at("pi-1").record.address, from);
  EXPECT_EQ(status.online_count, 1u);
}

TEST_F(LeaderNodeTest, AddressedCommandTargetsRegisteredHost) {
  node_->channel().Open();
  node_->registry().Register("pi-1", net::Endpoint{"10.0.0.42", 49152}, "ready", "");
  ASSERT_TRUE(node_->SendCommandTo("pi-1", protocol::StopMessage{}));

  auto sent = network_->Sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].to, (net::Endpoint{"10.0.0.42", config_.control.control_port}));
}

TEST_F(LeaderNodeTest, LocalMediaFollowsTheSession) {
  auto media = std::make_shared<fixtures::FakeMediaPlayer>();
  LeaderNode node(config_, clock_, network_->FactoryFor("10.0.0.9"), media);
  ASSERT_TRUE(node.StartSession().success);
  EXPECT_TRUE(media->IsPlaying());
  ASSERT_TRUE(node.StopSession().success);
  EXPECT_FALSE(media->IsPlaying());
}

// ============================================================================
// End to end over the in-memory network
// ============================================================================

class LeaderCollaboratorScenarioTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<fixtures::FakeMasterClock>();
    network_ = fixtures::LoopbackNetwork::Create();
    output_ = std::make_shared<fixtures::RecordingTriggerOutput>();

    LeaderConfig leader_config;
    leader_config.broadcaster.tick_interval_s = sync::kMaxTickIntervalS;
    leader_config.control.poll_interval_s = 0.02;
    leader_ = std::make_unique<LeaderNode>(leader_config, clock_,
                                           network_->FactoryFor("10.0.0.1"), nullptr);

    CollaboratorConfig collab_config;
    collab_config.device_id = "pi-kitchen";
    collab_config.media_ref = "loop.mp4";
    collab_config.sync.poll_interval_s = 0.02;
    collab_config.control.poll_interval_s = 0.02;
    collaborator_ = std::make_unique<CollaboratorNode>(
        collab_config, clock_, network_->FactoryFor("10.0.0.2"), nullptr, output_);
  }

  void TearDown() override {
    collaborator_->Close();
    leader_->Close();
  }

  // Advances the shared clock, sends one tick and waits for its receipt.
  void TickAfter(double seconds) {
    const uint64_t before = collaborator_->receiver().TicksReceived();
    clock_->AdvanceSeconds(seconds);
    ASSERT_TRUE(leader_->broadcaster().SendTick());
    ASSERT_TRUE(fixtures::Eventually(
        [&] { return collaborator_->receiver().TicksReceived() == before + 1; }));
  }

  std::shared_ptr<fixtures::FakeMasterClock> clock_;
  std::shared_ptr<fixtures::LoopbackNetwork> network_;
  std::shared_ptr<fixtures::RecordingTriggerOutput> output_;
  std::unique_ptr<LeaderNode> leader_;
  std::unique_ptr<CollaboratorNode> collaborator_;
};

TEST_F(LeaderCollaboratorScenarioTest, CollaboratorRegistersOnOpen) {
  leader_->Open();
  collaborator_->Open();

  ASSERT_TRUE(fixtures::Eventually([&] { return leader_->registry().Count() == 1; }));
  auto view = leader_->registry().Snapshot().at("pi-kitchen");
  EXPECT_EQ(view.record.address.host, "10.0.0.2");
  EXPECT_EQ(view.record.media_ref, "loop.mp4");
  EXPECT_TRUE(view.online);
}

TEST_F(LeaderCollaboratorScenarioTest, SessionFiresCueOnceAndStopsCleanly) {
  leader_->Open();
  collaborator_->Open();
  ASSERT_TRUE(fixtures::Eventually([&] { return leader_->registry().Count() == 1; }));

  leader_->LoadSchedule({NoteAt(1.5)});
  ASSERT_TRUE(leader_->StartSession().success);
  ASSERT_TRUE(fixtures::Eventually([&] { return collaborator_->IsRunning(); }));
  // The broadcaster sends its first tick (time 0) as soon as it starts.
  ASSERT_TRUE(fixtures::Eventually(
      [&] { return collaborator_->receiver().TicksReceived() == 1; }));
  ASSERT_TRUE(fixtures::Eventually([&] {
    return leader_->registry().Snapshot().at("pi-kitchen").record.status == "running";
  }));

  TickAfter(1.0);
  EXPECT_TRUE(output_->Sent().empty());
  TickAfter(1.0);
  EXPECT_EQ(output_->SentTimes(), (std::vector<double>{1.5}));
  TickAfter(1.0);
  EXPECT_EQ(output_->Sent().size(), 1u);

  ASSERT_TRUE(leader_->StopSession().success);
  EXPECT_TRUE(fixtures::Eventually([&] { return !collaborator_->IsRunning(); }));
  EXPECT_TRUE(fixtures::Eventually([&] {
    return leader_->registry().Snapshot().at("pi-kitchen").record.status == "ready";
  }));
}

TEST_F(LeaderCollaboratorScenarioTest, ScheduleUpdateReachesRunningCollaborator) {
  leader_->Open();
  collaborator_->Open();
  leader_->LoadSchedule({NoteAt(0.5)});
  ASSERT_TRUE(leader_->StartSession().success);
  ASSERT_TRUE(fixtures::Eventually([&] { return collaborator_->IsRunning(); }));
  // The broadcaster sends its first tick (time 0) as soon as it starts.
  ASSERT_TRUE(fixtures::Eventually(
      [&] { return collaborator_->receiver().TicksReceived() == 1; }));

  TickAfter(1.0);
  ASSERT_EQ(output_->Sent().size(), 1u);

  ASSERT_TRUE(leader_->UpdateSchedule({NoteAt(0.8, 70), NoteAt(2.0, 71)}).success);
  ASSERT_TRUE(fixtures::Eventually(
      [&] { return collaborator_->scheduler().Stats().total_cues == 2; }));

  TickAfter(1.0);
  auto sent = output_->Sent();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[1].note, 71);
}

}  // namespace kitchensync::tests
