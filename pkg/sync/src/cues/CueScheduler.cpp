// Repository: KitchenSync
// Component: Cue Scheduler Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/cues/CueScheduler.hpp"

#include <cmath>
#include <cstdio>
#include <utility>
#include <vector>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::cues {

using util::Logger;

CueScheduler::CueScheduler(std::shared_ptr<ITriggerOutput> output, CueSchedulerConfig config)
    : output_(std::move(output)), config_(config) {}

void CueScheduler::Load(CueList cues) {
  SortCues(cues);
  const size_t count = cues.size();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cues_ = std::move(cues);
    last_fired_index_ = -1;
  }
  Logger::Info("[CueScheduler] Loaded " + std::to_string(count) + " cues");
}

void CueScheduler::Start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    last_fired_index_ = -1;
    last_elapsed_s_ = -1.0;
  }
  Logger::Info("[CueScheduler] Playback enabled");
}

void CueScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  Logger::Info("[CueScheduler] Playback disabled");
}

void CueScheduler::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
  cues_.clear();
  last_fired_index_ = -1;
  last_elapsed_s_ = -1.0;
}

size_t CueScheduler::Process(double elapsed_s) {
  // A NaN would pass every cue-time comparison and drain the pass.
  if (!std::isfinite(elapsed_s)) {
    Logger::Warn("[CueScheduler] Ignoring non-finite elapsed time");
    return 0;
  }

  std::vector<Cue> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return 0;

    if (elapsed_s < last_elapsed_s_ &&
        (last_elapsed_s_ - elapsed_s) > config_.loop_restart_threshold_s) {
      char buf[128];
      std::snprintf(buf, sizeof(buf),
                    "[CueScheduler] Loop detected: time jumped from %.2fs to %.2fs",
                    last_elapsed_s_, elapsed_s);
      Logger::Info(buf);
      last_fired_index_ = -1;
      ++loop_count_;
    }
    last_elapsed_s_ = elapsed_s;

    const auto count = static_cast<int64_t>(cues_.size());
    for (int64_t i = last_fired_index_ + 1; i < count; ++i) {
      const Cue& cue = cues_[static_cast<size_t>(i)];
      if (cue.time > elapsed_s) break;
      due.push_back(cue);
      last_fired_index_ = i;
    }
    fired_total_ += due.size();
  }

  uint64_t failures = 0;
  for (const Cue& cue : due) {
    if (!output_ || !output_->Send(cue)) {
      ++failures;
      Logger::Warn("[CueScheduler] Trigger output failed for " + DescribeCue(cue));
    }
  }
  if (failures > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    trigger_failures_ += failures;
  }
  return due.size();
}

void CueScheduler::SkipTo(double elapsed_s) {
  if (!std::isfinite(elapsed_s)) return;
  std::lock_guard<std::mutex> lock(mutex_);
  SkipToLocked(elapsed_s);
}

void CueScheduler::Replace(CueList cues, double elapsed_s) {
  if (!std::isfinite(elapsed_s)) elapsed_s = -1.0;
  SortCues(cues);
  const size_t count = cues.size();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cues_ = std::move(cues);
    SkipToLocked(elapsed_s);
  }
  Logger::Info("[CueScheduler] Replaced schedule with " + std::to_string(count) +
               " cues, resuming after " + std::to_string(elapsed_s) + "s");
}

void CueScheduler::SkipToLocked(double elapsed_s) {
  int64_t index = -1;
  const auto count = static_cast<int64_t>(cues_.size());
  while (index + 1 < count && cues_[static_cast<size_t>(index + 1)].time <= elapsed_s) {
    ++index;
  }
  last_fired_index_ = index;
  last_elapsed_s_ = elapsed_s;
}

bool CueScheduler::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

CueSchedulerStats CueScheduler::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CueSchedulerStats stats;
  stats.total_cues = cues_.size();
  stats.fired_this_pass = static_cast<size_t>(last_fired_index_ + 1);
  stats.remaining = stats.total_cues - stats.fired_this_pass;
  stats.loop_count = loop_count_;
  stats.fired_total = fired_total_;
  stats.trigger_failures = trigger_failures_;
  stats.running = running_;
  return stats;
}

CueList CueScheduler::Schedule() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cues_;
}

CueList CueScheduler::UpcomingCues(double elapsed_s, double lookahead_s, size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  CueList out;
  for (const Cue& cue : cues_) {
    if (out.size() >= limit) break;
    if (cue.time > elapsed_s && cue.time <= elapsed_s + lookahead_s) {
      out.push_back(cue);
    }
  }
  return out;
}

CueList CueScheduler::RecentCues(double elapsed_s, double lookback_s, size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  CueList window;
  for (const Cue& cue : cues_) {
    if (cue.time > elapsed_s) break;
    if (cue.time >= elapsed_s - lookback_s) {
      window.push_back(cue);
    }
  }
  if (window.size() > limit) {
    window.erase(window.begin(), window.end() - static_cast<std::ptrdiff_t>(limit));
  }
  return window;
}

}  // namespace kitchensync::cues
