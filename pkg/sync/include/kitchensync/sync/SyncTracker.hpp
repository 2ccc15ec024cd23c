// Repository: KitchenSync
// Component: Sync Tracker
// Purpose: Estimates clock drift against the leader and classifies sync quality.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_SYNC_SYNC_TRACKER_HPP_
#define KITCHENSYNC_SYNC_SYNC_TRACKER_HPP_

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::sync {

enum class SyncQuality {
  kNoData,
  kLost,
  kDegraded,
  kExcellent,
  kGood,
  kFair,
  kPoor,
};

const char* SyncQualityName(SyncQuality quality);

inline constexpr size_t kDefaultDriftWindow = 50;
inline constexpr double kDefaultSyncedTimeoutS = 5.0;

// Silence thresholds (seconds since the last sample).
inline constexpr double kSyncDegradedAfterS = 5.0;
inline constexpr double kSyncLostAfterS = 10.0;

// |average drift| thresholds (seconds).
inline constexpr double kDriftExcellentBelowS = 0.1;
inline constexpr double kDriftGoodBelowS = 0.5;
inline constexpr double kDriftFairBelowS = 1.0;

struct SyncSample {
  double leader_time = 0.0;
  double local_receipt_time = 0.0;
};

struct SyncTrackerStats {
  size_t sample_count = 0;
  size_t drift_count = 0;
  double average_drift = 0.0;
  SyncQuality quality = SyncQuality::kNoData;
  std::optional<double> seconds_since_last_sample;
  bool synced = false;
};

// SyncTracker keeps two bounded, arrival-ordered windows: the raw samples and
// one drift value per consecutive pair.
//
// RecordSync(leader, local):
//   expected = prev.leader_time + (local - prev.local_receipt_time)
//   drift    = leader - expected
//
// Drift is always relative to the previous sample, so a lost or duplicated
// tick only perturbs one drift value and self-corrects on the next.
//
// Silence is measured on the tracker's clock from the moment of the last
// RecordSync call. All methods are thread-safe.
class SyncTracker {
 public:
  explicit SyncTracker(std::shared_ptr<timing::MasterClock> clock,
                       size_t window = kDefaultDriftWindow);

  void RecordSync(double leader_time, double local_receipt_time);

  // True iff the last sample arrived less than `timeout_s` ago.
  bool IsSynced(double timeout_s = kDefaultSyncedTimeoutS) const;

  // Arithmetic mean of the drift window; 0 when empty.
  double AverageDrift() const;

  SyncQuality Quality() const;

  SyncTrackerStats Stats() const;

  std::optional<SyncSample> LastSample() const;

  void Reset();

 private:
  double AverageDriftLocked() const;
  SyncQuality QualityLocked(double now) const;

  std::shared_ptr<timing::MasterClock> clock_;
  const size_t window_;

  mutable std::mutex mutex_;
  std::deque<SyncSample> samples_;
  std::deque<double> drifts_;
  std::optional<double> last_record_time_;
};

}  // namespace kitchensync::sync

#endif  // KITCHENSYNC_SYNC_SYNC_TRACKER_HPP_
