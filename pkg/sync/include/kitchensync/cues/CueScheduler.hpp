// Repository: KitchenSync
// Component: Cue Scheduler
// Purpose: Fires due cues exactly once per playback pass against the synced clock.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_CUES_CUE_SCHEDULER_HPP_
#define KITCHENSYNC_CUES_CUE_SCHEDULER_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "kitchensync/cues/Cue.hpp"
#include "kitchensync/cues/ITriggerOutput.hpp"

namespace kitchensync::cues {

struct CueSchedulerConfig {
  // A backward jump of elapsed time larger than this is read as a playback
  // restart (looped media) and re-arms every cue. Smaller backward jitter is
  // ignored. Heuristic: it cannot tell a user seek-back from a loop.
  double loop_restart_threshold_s = 1.0;
};

struct CueSchedulerStats {
  size_t total_cues = 0;
  size_t fired_this_pass = 0;
  size_t remaining = 0;
  uint64_t loop_count = 0;
  uint64_t fired_total = 0;
  uint64_t trigger_failures = 0;
  bool running = false;
};

// CueScheduler walks a sorted cue list with a monotonic cursor.
//
// Per Process(elapsed) call while running:
//   1. If elapsed < last_elapsed and the gap exceeds loop_restart_threshold_s,
//      the cursor is reset to -1 (restart).
//   2. last_elapsed = elapsed.
//   3. From cursor+1, every cue with time <= elapsed is handed to the trigger
//      output and the cursor advances; scanning stops at the first cue with
//      time > elapsed.
//
// Each cue therefore fires at most once per pass, in ascending time order, as
// long as elapsed is non-decreasing within a pass.
//
// Thread-safety: one mutex guards the cursor and schedule. Triggers are sent
// after the lock is released so a slow output never blocks status readers.
class CueScheduler {
 public:
  explicit CueScheduler(std::shared_ptr<ITriggerOutput> output,
                        CueSchedulerConfig config = CueSchedulerConfig());

  CueScheduler(const CueScheduler&) = delete;
  CueScheduler& operator=(const CueScheduler&) = delete;

  // Replaces the schedule (sorted defensively) and resets the cursor.
  void Load(CueList cues);

  // Enables firing. Resets cursor and last elapsed time. No-op if running.
  void Start();

  // Disables firing. The loaded schedule is kept.
  void Stop();

  // Drops the schedule and stops (session teardown).
  void Clear();

  // Returns the number of cues fired by this call. A non-finite elapsed time
  // is ignored and fires nothing.
  size_t Process(double elapsed_s);

  // Marks every cue at or before `elapsed_s` as already fired without firing
  // it.
  void SkipTo(double elapsed_s);

  // Load() and SkipTo() as one step, so a tick processed concurrently never
  // sees the new schedule with a reset cursor. Used for mid-session schedule
  // replacement.
  void Replace(CueList cues, double elapsed_s);

  bool IsRunning() const;
  CueSchedulerStats Stats() const;

  // Copy of the loaded (sorted) schedule.
  CueList Schedule() const;

  // Cues in (elapsed, elapsed + lookahead], at most `limit`.
  CueList UpcomingCues(double elapsed_s, double lookahead_s = 10.0, size_t limit = 5) const;

  // Cues in [elapsed - lookback, elapsed], the last `limit` of them.
  CueList RecentCues(double elapsed_s, double lookback_s = 5.0, size_t limit = 5) const;

 private:
  std::shared_ptr<ITriggerOutput> output_;
  CueSchedulerConfig config_;

  void SkipToLocked(double elapsed_s);

  mutable std::mutex mutex_;
  CueList cues_;
  bool running_ = false;
  int64_t last_fired_index_ = -1;
  double last_elapsed_s_ = -1.0;
  uint64_t loop_count_ = 0;
  uint64_t fired_total_ = 0;
  uint64_t trigger_failures_ = 0;
};

}  // namespace kitchensync::cues

#endif  // KITCHENSYNC_CUES_CUE_SCHEDULER_HPP_
