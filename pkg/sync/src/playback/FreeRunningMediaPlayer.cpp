// Repository: KitchenSync
// Component: Free-Running Media Player Implementation
// Copyright (c) 2025 RetroVue

#include <cmath>
#include <utility>

#include "kitchensync/playback/IMediaPlayer.hpp"
#include "kitchensync/util/Logger.hpp"

namespace kitchensync::playback {

FreeRunningMediaPlayer::FreeRunningMediaPlayer(std::shared_ptr<timing::MasterClock> clock,
                                               std::optional<double> duration_s, bool loop)
    : clock_(std::move(clock)), duration_s_(duration_s), loop_(loop) {}

std::optional<double> FreeRunningMediaPlayer::GetPosition() {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!playing_) return std::nullopt;
  return PositionLocked(now);
}

bool FreeRunningMediaPlayer::SetPosition(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) return false;
  if (duration_s_ && *duration_s_ > 0.0 && seconds > *duration_s_) return false;

  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!playing_) return false;
  origin_s_ = now - seconds;
  return true;
}

bool FreeRunningMediaPlayer::Play() {
  const double now = clock_->now_monotonic_s();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (playing_) return true;
    playing_ = true;
    origin_s_ = now;
  }
  util::Logger::Info("[FreeRunningMediaPlayer] Playing");
  return true;
}

void FreeRunningMediaPlayer::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!playing_) return;
    playing_ = false;
  }
  util::Logger::Info("[FreeRunningMediaPlayer] Stopped");
}

bool FreeRunningMediaPlayer::IsPlaying() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return playing_;
}

double FreeRunningMediaPlayer::PositionLocked(double now) const {
  double position = now - origin_s_;
  if (position < 0.0) position = 0.0;
  if (duration_s_ && *duration_s_ > 0.0) {
    if (loop_) {
      position = std::fmod(position, *duration_s_);
    } else if (position > *duration_s_) {
      position = *duration_s_;
    }
  }
  return position;
}

}  // namespace kitchensync::playback
