// Contract Tests: SessionState, BackgroundTask, FreeRunningMediaPlayer

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "kitchensync/playback/IMediaPlayer.hpp"
#include "kitchensync/runtime/BackgroundTask.hpp"
#include "kitchensync/session/SessionState.hpp"
#include "kitchensync/util/Logger.hpp"
#include "../../fixtures/Eventually.h"
#include "../../fixtures/FakeMasterClock.h"

namespace kitchensync::tests {

// ============================================================================
// SessionState
// ============================================================================

class SessionStateTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<fixtures::FakeMasterClock>();
    session_ = std::make_unique<session::SessionState>(clock_);
  }

  std::shared_ptr<fixtures::FakeMasterClock> clock_;
  std::unique_ptr<session::SessionState> session_;
};

TEST_F(SessionStateTest, StartRecordsEpochAndWallClock) {
  const double epoch = session_->Start();
  EXPECT_DOUBLE_EQ(epoch, clock_->now_monotonic_s());

  auto snapshot = session_->Snapshot();
  EXPECT_TRUE(snapshot.is_running);
  ASSERT_TRUE(snapshot.start_time_utc_s.has_value());
  EXPECT_DOUBLE_EQ(*snapshot.start_time_utc_s, clock_->now_utc_s());
  EXPECT_DOUBLE_EQ(snapshot.current_time_s, 0.0);
}

TEST_F(SessionStateTest, UpdateTracksElapsedTime) {
  session_->Start();
  clock_->AdvanceSeconds(75.0);
  EXPECT_DOUBLE_EQ(session_->Update(), 75.0);
  EXPECT_EQ(session_->FormattedTime(), "01:15");
}

TEST_F(SessionStateTest, SetCurrentTimeIgnoredWhenStopped) {
  session_->SetCurrentTime(9.0);
  EXPECT_DOUBLE_EQ(session_->CurrentTime(), 0.0);
  session_->Start();
  session_->SetCurrentTime(9.0);
  EXPECT_DOUBLE_EQ(session_->CurrentTime(), 9.0);
}

TEST_F(SessionStateTest, NonFiniteCurrentTimeIsIgnored) {
  session_->Start();
  session_->SetCurrentTime(9.0);
  session_->SetCurrentTime(std::numeric_limits<double>::quiet_NaN());
  session_->SetCurrentTime(std::numeric_limits<double>::infinity());
  EXPECT_DOUBLE_EQ(session_->CurrentTime(), 9.0);
}

TEST_F(SessionStateTest, StopAccumulatesRuntime) {
  session_->Start();
  clock_->AdvanceSeconds(10.0);
  session_->Stop();
  session_->Start();
  clock_->AdvanceSeconds(4.0);
  session_->Stop();

  auto stats = session_->Stats();
  EXPECT_EQ(stats.sessions_started, 2u);
  EXPECT_DOUBLE_EQ(stats.total_runtime_s, 14.0);
  EXPECT_DOUBLE_EQ(stats.last_session_duration_s, 4.0);
  EXPECT_FALSE(session_->EpochMonotonic().has_value());
  EXPECT_DOUBLE_EQ(session_->CurrentTime(), 0.0);
}

TEST_F(SessionStateTest, StartWhileRunningStopsPreviousSession) {
  session_->Start();
  clock_->AdvanceSeconds(6.0);
  session_->Start();

  auto stats = session_->Stats();
  EXPECT_EQ(stats.sessions_started, 2u);
  EXPECT_DOUBLE_EQ(stats.last_session_duration_s, 6.0);
  EXPECT_TRUE(session_->IsRunning());
}

// ============================================================================
// BackgroundTask
// ============================================================================

TEST(BackgroundTaskTest, StopWakesAWaitingBody) {
  runtime::BackgroundTask task("test");
  std::atomic<int> iterations{0};
  ASSERT_TRUE(task.Start([&](const runtime::StopToken& token) {
    while (!token.WaitFor(std::chrono::seconds(30))) ++iterations;
  }));
  EXPECT_TRUE(task.IsRunning());

  const auto begin = std::chrono::steady_clock::now();
  task.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
  EXPECT_FALSE(task.IsRunning());
  EXPECT_EQ(iterations.load(), 0);
}

TEST(BackgroundTaskTest, SecondStartWhileRunningIsRefused) {
  runtime::BackgroundTask task("test");
  auto body = [](const runtime::StopToken& token) {
    while (!token.WaitFor(std::chrono::milliseconds(10))) {
    }
  };
  ASSERT_TRUE(task.Start(body));
  EXPECT_FALSE(task.Start(body));
  task.Stop();
  EXPECT_TRUE(task.Start(body)) << "restart after stop";
  task.Stop();
}

TEST(BackgroundTaskTest, ExceptionInBodyIsLoggedAndEndsTask) {
  std::vector<std::string> errors;
  util::Logger::SetErrorSink([&](const std::string& line) { errors.push_back(line); });

  runtime::BackgroundTask task("exploding");
  task.Start([](const runtime::StopToken&) { throw std::runtime_error("socket gone"); });
  EXPECT_TRUE(fixtures::Eventually([&] { return !task.IsRunning(); }));
  task.Join();
  util::Logger::SetErrorSink(nullptr);

  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("socket gone"), std::string::npos);
}

// ============================================================================
// FreeRunningMediaPlayer
// ============================================================================

TEST(FreeRunningMediaPlayerTest, PositionAdvancesAndWraps) {
  auto clock = std::make_shared<fixtures::FakeMasterClock>();
  playback::FreeRunningMediaPlayer player(clock, 10.0, true);

  EXPECT_FALSE(player.GetPosition().has_value());
  ASSERT_TRUE(player.Play());
  clock->AdvanceSeconds(12.5);
  ASSERT_TRUE(player.GetPosition().has_value());
  EXPECT_NEAR(*player.GetPosition(), 2.5, 1e-9);
}

TEST(FreeRunningMediaPlayerTest, HoldsAtEndWithoutLoop) {
  auto clock = std::make_shared<fixtures::FakeMasterClock>();
  playback::FreeRunningMediaPlayer player(clock, 10.0, false);
  player.Play();
  clock->AdvanceSeconds(30.0);
  EXPECT_DOUBLE_EQ(*player.GetPosition(), 10.0);
}

TEST(FreeRunningMediaPlayerTest, SeekMovesPositionWithinBounds) {
  auto clock = std::make_shared<fixtures::FakeMasterClock>();
  playback::FreeRunningMediaPlayer player(clock, 10.0, true);
  EXPECT_FALSE(player.SetPosition(1.0)) << "not playing";

  player.Play();
  EXPECT_TRUE(player.SetPosition(7.0));
  EXPECT_NEAR(*player.GetPosition(), 7.0, 1e-9);
  EXPECT_FALSE(player.SetPosition(11.0));
  EXPECT_FALSE(player.SetPosition(-1.0));

  player.Stop();
  EXPECT_FALSE(player.IsPlaying());
}

}  // namespace kitchensync::tests
