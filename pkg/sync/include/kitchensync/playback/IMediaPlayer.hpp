// Repository: KitchenSync
// Component: Media Player Interface
// Purpose: Capability through which the engine observes and steers local playback.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_PLAYBACK_IMEDIA_PLAYER_HPP_
#define KITCHENSYNC_PLAYBACK_IMEDIA_PLAYER_HPP_

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::playback {

// IMediaPlayer wraps whatever decodes and renders the media. The engine never
// touches frames; it only reads the position and seeks.
//
// Implementations must be thread-safe: the corrector calls from the sync
// listener task while the command handlers call Play/Stop.
class IMediaPlayer {
 public:
  virtual ~IMediaPlayer() = default;

  // Current media position in seconds, or nullopt when unknown/not playing.
  virtual std::optional<double> GetPosition() = 0;

  // Media duration in seconds, or nullopt when unknown.
  virtual std::optional<double> GetDuration() = 0;

  // Seeks. Returns false if the player rejected the seek.
  virtual bool SetPosition(double seconds) = 0;

  virtual bool Play() = 0;
  virtual void Stop() = 0;
  virtual bool IsPlaying() const = 0;

  virtual std::string GetName() const = 0;
};

// FreeRunningMediaPlayer is a synthetic player whose position advances with
// the master clock. With a positive duration and looping enabled the position
// wraps; without looping it holds at the end. Used by the standalone harness
// when no real player is attached, and by tests.
class FreeRunningMediaPlayer : public IMediaPlayer {
 public:
  FreeRunningMediaPlayer(std::shared_ptr<timing::MasterClock> clock,
                         std::optional<double> duration_s, bool loop = true);

  std::optional<double> GetPosition() override;
  std::optional<double> GetDuration() override { return duration_s_; }
  bool SetPosition(double seconds) override;
  bool Play() override;
  void Stop() override;
  bool IsPlaying() const override;
  std::string GetName() const override { return "FreeRunningMediaPlayer"; }

 private:
  double PositionLocked(double now) const;

  std::shared_ptr<timing::MasterClock> clock_;
  const std::optional<double> duration_s_;
  const bool loop_;

  mutable std::mutex mutex_;
  bool playing_ = false;
  // Monotonic time at which position 0 was (virtually) played.
  double origin_s_ = 0.0;
};

}  // namespace kitchensync::playback

#endif  // KITCHENSYNC_PLAYBACK_IMEDIA_PLAYER_HPP_
