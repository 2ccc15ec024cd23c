// Repository: KitchenSync
// Component: Session State Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/session/SessionState.hpp"

#include <cmath>
#include <cstdio>
#include <utility>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::session {

using util::Logger;

SessionState::SessionState(std::shared_ptr<timing::MasterClock> clock)
    : clock_(std::move(clock)) {}

double SessionState::Start() {
  const double now = clock_->now_monotonic_s();
  const double now_utc = clock_->now_utc_s();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) StopLocked(now);
    running_ = true;
    start_monotonic_s_ = now;
    start_utc_s_ = now_utc;
    current_time_s_ = 0.0;
    ++stats_.sessions_started;
  }
  Logger::Info("[SessionState] Session started");
  return now;
}

void SessionState::Stop() {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  StopLocked(now);
}

void SessionState::StopLocked(double now) {
  if (running_ && start_monotonic_s_) {
    const double duration = now - *start_monotonic_s_;
    stats_.total_runtime_s += duration;
    stats_.last_session_duration_s = duration;
    char buf[96];
    std::snprintf(buf, sizeof(buf), "[SessionState] Session ended (duration: %.1fs)", duration);
    Logger::Info(buf);
  }
  running_ = false;
  start_monotonic_s_.reset();
  start_utc_s_.reset();
  current_time_s_ = 0.0;
}

bool SessionState::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

double SessionState::Update() {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_ && start_monotonic_s_) {
    current_time_s_ = now - *start_monotonic_s_;
  }
  return current_time_s_;
}

void SessionState::SetCurrentTime(double seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_ && std::isfinite(seconds)) current_time_s_ = seconds;
}

double SessionState::CurrentTime() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_time_s_;
}

std::optional<double> SessionState::EpochMonotonic() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return start_monotonic_s_;
}

SessionSnapshot SessionState::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return SessionSnapshot{running_, start_utc_s_, current_time_s_};
}

SessionStats SessionState::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::string SessionState::FormattedTime() const {
  const double t = CurrentTime();
  const int total = t > 0.0 ? static_cast<int>(t) : 0;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", total / 60, total % 60);
  return buf;
}

}  // namespace kitchensync::session
