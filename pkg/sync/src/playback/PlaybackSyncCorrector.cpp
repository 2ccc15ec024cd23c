// Repository: KitchenSync
// Component: Playback Sync Corrector Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/playback/PlaybackSyncCorrector.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>
#include <vector>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::playback {

using util::Logger;

const char* CorrectionOutcomeName(CorrectionOutcome outcome) {
  switch (outcome) {
    case CorrectionOutcome::kCollecting:
      return "collecting";
    case CorrectionOutcome::kWithinTolerance:
      return "within_tolerance";
    case CorrectionOutcome::kCoolingDown:
      return "cooling_down";
    case CorrectionOutcome::kCorrected:
      return "corrected";
    case CorrectionOutcome::kSeekFailed:
      return "seek_failed";
  }
  return "unknown";
}

PlaybackSyncCorrector::PlaybackSyncCorrector(CorrectorConfig config,
                                             std::shared_ptr<IMediaPlayer> player,
                                             std::shared_ptr<timing::MasterClock> clock)
    : config_(config), player_(std::move(player)), clock_(std::move(clock)) {
  if (config_.window == 0) config_.window = 1;
  if (config_.min_samples == 0) config_.min_samples = 1;
  if (config_.min_samples > config_.window) config_.min_samples = config_.window;
}

double PlaybackSyncCorrector::Median(std::deque<double> samples) {
  if (samples.empty()) return 0.0;
  std::sort(samples.begin(), samples.end());
  const size_t mid = samples.size() / 2;
  if (samples.size() % 2 == 1) return samples[mid];
  return (samples[mid - 1] + samples[mid]) / 2.0;
}

double PlaybackSyncCorrector::ExpectedPosition(double session_time,
                                               std::optional<double> duration, bool wrap) {
  if (wrap && duration && *duration > 0.0 && session_time >= 0.0) {
    return std::fmod(session_time, *duration);
  }
  return session_time;
}

CorrectionOutcome PlaybackSyncCorrector::CheckAndCorrect(double expected_position,
                                                         double actual_position, double now) {
  double median = 0.0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++checks_;
    const double deviation = actual_position - expected_position;
    // NaN would break the median's ordering; such a sample is not kept.
    if (!std::isfinite(deviation)) return CorrectionOutcome::kCollecting;
    samples_.push_back(deviation);
    if (samples_.size() > config_.window) samples_.pop_front();

    if (samples_.size() < config_.min_samples) {
      return CorrectionOutcome::kCollecting;
    }

    median = Median(samples_);
    last_median_ = median;
    if (std::fabs(median) <= config_.deviation_threshold_s) {
      return CorrectionOutcome::kWithinTolerance;
    }
    if (last_correction_time_ && (now - *last_correction_time_) < config_.cooldown_s) {
      return CorrectionOutcome::kCoolingDown;
    }
  }

  // Seek outside the lock; the player may block.
  const bool ok = player_ && player_->SetPosition(expected_position);

  char buf[160];
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ok) {
    ++seek_failures_;
    std::snprintf(buf, sizeof(buf),
                  "[PlaybackSyncCorrector] Seek to %.3fs failed (median deviation %+.3fs)",
                  expected_position, median);
    Logger::Warn(buf);
    return CorrectionOutcome::kSeekFailed;
  }

  ++corrections_;
  last_correction_time_ = now;
  samples_.clear();
  std::snprintf(buf, sizeof(buf),
                "[PlaybackSyncCorrector] Corrected: median deviation %+.3fs, seek to %.3fs",
                median, expected_position);
  Logger::Info(buf);
  return CorrectionOutcome::kCorrected;
}

std::optional<CorrectionOutcome> PlaybackSyncCorrector::OnTick(const sync::SyncTick& tick) {
  if (!player_) return std::nullopt;
  const double now = clock_->now_monotonic_s();

  if (config_.check_interval_s > 0.0) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_check_time_ && (now - *last_check_time_) < config_.check_interval_s) {
      return std::nullopt;
    }
    last_check_time_ = now;
  }

  auto actual = player_->GetPosition();
  if (!actual) return std::nullopt;

  // The tick may have waited behind earlier subscribers.
  const double session_time = tick.leader_time + std::max(0.0, now - tick.receipt_time);
  const double expected =
      ExpectedPosition(session_time, player_->GetDuration(), config_.wrap_to_duration);
  return CheckAndCorrect(expected, *actual, now);
}

void PlaybackSyncCorrector::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  samples_.clear();
  last_correction_time_.reset();
  last_check_time_.reset();
  last_median_.reset();
}

CorrectorStats PlaybackSyncCorrector::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CorrectorStats stats;
  stats.sample_count = samples_.size();
  stats.checks = checks_;
  stats.corrections = corrections_;
  stats.seek_failures = seek_failures_;
  stats.last_median = last_median_;
  stats.last_correction_time = last_correction_time_;
  return stats;
}

}  // namespace kitchensync::playback
