// Repository: KitchenSync
// Component: Playback Sync Corrector
// Purpose: Median-filtered, rate-limited seek correction of local media playback.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_PLAYBACK_PLAYBACK_SYNC_CORRECTOR_HPP_
#define KITCHENSYNC_PLAYBACK_PLAYBACK_SYNC_CORRECTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "kitchensync/playback/IMediaPlayer.hpp"
#include "kitchensync/sync/TickBus.hpp"
#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::playback {

struct CorrectorConfig {
  double deviation_threshold_s = 0.5;
  double cooldown_s = 3.0;
  size_t min_samples = 5;
  size_t window = 10;
  // Minimum spacing between OnTick checks. 0 checks on every tick.
  double check_interval_s = 0.0;
  // Wrap the expected position modulo the media duration (looping media).
  bool wrap_to_duration = true;
};

enum class CorrectionOutcome {
  kCollecting,       // fewer than min_samples in the window
  kWithinTolerance,  // |median| <= threshold
  kCoolingDown,      // out of tolerance, but the last correction is too recent
  kCorrected,        // seek issued; window cleared
  kSeekFailed,       // player rejected the seek; window retained
};

const char* CorrectionOutcomeName(CorrectionOutcome outcome);

struct CorrectorStats {
  size_t sample_count = 0;
  uint64_t checks = 0;
  uint64_t corrections = 0;
  uint64_t seek_failures = 0;
  std::optional<double> last_median;
  std::optional<double> last_correction_time;
};

// PlaybackSyncCorrector
//
// CheckAndCorrect(expected, actual, now):
//   deviation = actual - expected, appended to a window of `window` samples.
//   A non-finite deviation is discarded and reported as kCollecting.
//   With at least min_samples, median = median(window) (mean of the two middle
//   values for an even count). If |median| > threshold and no correction
//   happened within cooldown_s, seek the player to `expected`, record `now`
//   and clear the window.
//
// The median rejects single outliers (seek latency, frame discontinuities);
// the cooldown keeps noisy measurements from causing repeated visible seeks.
class PlaybackSyncCorrector {
 public:
  PlaybackSyncCorrector(CorrectorConfig config, std::shared_ptr<IMediaPlayer> player,
                        std::shared_ptr<timing::MasterClock> clock);

  PlaybackSyncCorrector(const PlaybackSyncCorrector&) = delete;
  PlaybackSyncCorrector& operator=(const PlaybackSyncCorrector&) = delete;

  CorrectionOutcome CheckAndCorrect(double expected_position, double actual_position, double now);

  // Tick adapter: queries the player and runs CheckAndCorrect. Returns
  // nullopt when no check ran (player position unknown, or the check
  // interval has not elapsed).
  std::optional<CorrectionOutcome> OnTick(const sync::SyncTick& tick);

  // Expected media position for a session time, wrapped modulo `duration`
  // when it is known and positive.
  static double ExpectedPosition(double session_time, std::optional<double> duration,
                                 bool wrap);

  // Median of `samples` (mean of the two middle values for even sizes).
  static double Median(std::deque<double> samples);

  // Clears samples and the cooldown (new session).
  void Reset();

  CorrectorStats Stats() const;

 private:
  CorrectorConfig config_;
  std::shared_ptr<IMediaPlayer> player_;
  std::shared_ptr<timing::MasterClock> clock_;

  mutable std::mutex mutex_;
  std::deque<double> samples_;
  std::optional<double> last_correction_time_;
  std::optional<double> last_check_time_;
  std::optional<double> last_median_;
  uint64_t checks_ = 0;
  uint64_t corrections_ = 0;
  uint64_t seek_failures_ = 0;
};

}  // namespace kitchensync::playback

#endif  // KITCHENSYNC_PLAYBACK_PLAYBACK_SYNC_CORRECTOR_HPP_
