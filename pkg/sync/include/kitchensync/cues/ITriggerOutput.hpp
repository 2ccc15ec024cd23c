// Repository: KitchenSync
// Component: Trigger Output Interface
// Purpose: Capability the cue scheduler hands due cues to.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_CUES_ITRIGGER_OUTPUT_HPP_
#define KITCHENSYNC_CUES_ITRIGGER_OUTPUT_HPP_

#include <atomic>
#include <cstdint>
#include <string>

#include "kitchensync/cues/Cue.hpp"

namespace kitchensync::cues {

// ITriggerOutput emits the physical signal for a cue (MIDI, relay, ...).
// The engine never encodes the physical protocol itself.
class ITriggerOutput {
 public:
  virtual ~ITriggerOutput() = default;

  // Emits the cue. Returns false if the device rejected or failed the send.
  // Must not throw; called from the sync listener task.
  virtual bool Send(const Cue& cue) = 0;

  virtual std::string GetName() const = 0;
};

// Writes every fired cue to the log. Used by the standalone harness when no
// hardware output is attached.
class LoggingTriggerOutput : public ITriggerOutput {
 public:
  bool Send(const Cue& cue) override;
  std::string GetName() const override { return "LoggingTriggerOutput"; }

  uint64_t GetSentCount() const { return sent_.load(std::memory_order_relaxed); }

 private:
  std::atomic<uint64_t> sent_{0};
};

}  // namespace kitchensync::cues

#endif  // KITCHENSYNC_CUES_ITRIGGER_OUTPUT_HPP_
