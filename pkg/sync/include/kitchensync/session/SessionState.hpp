// Repository: KitchenSync
// Component: Session State
// Purpose: Running flag, start time and elapsed time of the current session.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_SESSION_SESSION_STATE_HPP_
#define KITCHENSYNC_SESSION_SESSION_STATE_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::session {

struct SessionStats {
  uint64_t sessions_started = 0;
  double total_runtime_s = 0.0;
  double last_session_duration_s = 0.0;
};

struct SessionSnapshot {
  bool is_running = false;
  std::optional<double> start_time_utc_s;  // wall clock, seconds since epoch
  double current_time_s = 0.0;
};

// SessionState is owned by one node. Start() while running first performs an
// implicit Stop() so the previous session is accounted for.
class SessionState {
 public:
  explicit SessionState(std::shared_ptr<timing::MasterClock> clock);

  // Starts a session now. Returns the monotonic epoch of the session.
  double Start();
  void Stop();

  bool IsRunning() const;

  // Leader: recomputes current time from the clock and returns it.
  double Update();

  // Collaborator: adopts the session time carried by the leader's ticks.
  // Ignored while not running.
  void SetCurrentTime(double seconds);

  double CurrentTime() const;

  // Monotonic epoch of the running session.
  std::optional<double> EpochMonotonic() const;

  SessionSnapshot Snapshot() const;
  SessionStats Stats() const;

  // "MM:SS" of the current time.
  std::string FormattedTime() const;

 private:
  void StopLocked(double now);

  std::shared_ptr<timing::MasterClock> clock_;

  mutable std::mutex mutex_;
  bool running_ = false;
  std::optional<double> start_utc_s_;
  std::optional<double> start_monotonic_s_;
  double current_time_s_ = 0.0;
  SessionStats stats_;
};

}  // namespace kitchensync::session

#endif  // KITCHENSYNC_SESSION_SESSION_STATE_HPP_
