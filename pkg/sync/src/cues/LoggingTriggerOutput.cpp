// Repository: KitchenSync
// Component: Logging Trigger Output
// Copyright (c) 2025 RetroVue

#include "kitchensync/cues/ITriggerOutput.hpp"
#include "kitchensync/util/Logger.hpp"

namespace kitchensync::cues {

bool LoggingTriggerOutput::Send(const Cue& cue) {
  sent_.fetch_add(1, std::memory_order_relaxed);
  std::string line = "[Trigger] " + DescribeCue(cue);
  if (!cue.description.empty()) {
    line += " (" + cue.description + ")";
  }
  util::Logger::Info(line);
  return true;
}

}  // namespace kitchensync::cues
