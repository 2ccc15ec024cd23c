// Repository: KitchenSync
// Component: Sync Tracker Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/sync/SyncTracker.hpp"

#include <cmath>
#include <numeric>
#include <utility>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::sync {

const char* SyncQualityName(SyncQuality quality) {
  switch (quality) {
    case SyncQuality::kNoData:
      return "no_data";
    case SyncQuality::kLost:
      return "lost";
    case SyncQuality::kDegraded:
      return "degraded";
    case SyncQuality::kExcellent:
      return "excellent";
    case SyncQuality::kGood:
      return "good";
    case SyncQuality::kFair:
      return "fair";
    case SyncQuality::kPoor:
      return "poor";
  }
  return "unknown";
}

SyncTracker::SyncTracker(std::shared_ptr<timing::MasterClock> clock, size_t window)
    : clock_(std::move(clock)), window_(window > 0 ? window : 1) {}

void SyncTracker::RecordSync(double leader_time, double local_receipt_time) {
  if (!std::isfinite(leader_time) || !std::isfinite(local_receipt_time)) {
    util::Logger::Warn("[SyncTracker] Ignoring sample with non-finite time");
    return;
  }
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);

  if (!samples_.empty()) {
    const SyncSample& prev = samples_.back();
    const double expected = prev.leader_time + (local_receipt_time - prev.local_receipt_time);
    drifts_.push_back(leader_time - expected);
    if (drifts_.size() > window_) drifts_.pop_front();
  }

  samples_.push_back(SyncSample{leader_time, local_receipt_time});
  if (samples_.size() > window_) samples_.pop_front();
  last_record_time_ = now;
}

bool SyncTracker::IsSynced(double timeout_s) const {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!last_record_time_) return false;
  return (now - *last_record_time_) < timeout_s;
}

double SyncTracker::AverageDrift() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return AverageDriftLocked();
}

SyncQuality SyncTracker::Quality() const {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  return QualityLocked(now);
}

SyncTrackerStats SyncTracker::Stats() const {
  const double now = clock_->now_monotonic_s();
  std::lock_guard<std::mutex> lock(mutex_);
  SyncTrackerStats stats;
  stats.sample_count = samples_.size();
  stats.drift_count = drifts_.size();
  stats.average_drift = AverageDriftLocked();
  stats.quality = QualityLocked(now);
  if (last_record_time_) {
    stats.seconds_since_last_sample = now - *last_record_time_;
    stats.synced = *stats.seconds_since_last_sample < kDefaultSyncedTimeoutS;
  }
  return stats;
}

std::optional<SyncSample> SyncTracker::LastSample() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (samples_.empty()) return std::nullopt;
  return samples_.back();
}

void SyncTracker::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  samples_.clear();
  drifts_.clear();
  last_record_time_.reset();
}

double SyncTracker::AverageDriftLocked() const {
  if (drifts_.empty()) return 0.0;
  return std::accumulate(drifts_.begin(), drifts_.end(), 0.0) /
         static_cast<double>(drifts_.size());
}

SyncQuality SyncTracker::QualityLocked(double now) const {
  if (samples_.empty() || !last_record_time_) return SyncQuality::kNoData;

  const double silence = now - *last_record_time_;
  if (silence > kSyncLostAfterS) return SyncQuality::kLost;
  if (silence > kSyncDegradedAfterS) return SyncQuality::kDegraded;

  const double drift = std::fabs(AverageDriftLocked());
  if (drift < kDriftExcellentBelowS) return SyncQuality::kExcellent;
  if (drift < kDriftGoodBelowS) return SyncQuality::kGood;
  if (drift < kDriftFairBelowS) return SyncQuality::kFair;
  return SyncQuality::kPoor;
}

}  // namespace kitchensync::sync
