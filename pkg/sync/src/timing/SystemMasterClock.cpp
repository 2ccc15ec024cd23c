// Repository: KitchenSync
// Component: System Master Clock
// Purpose: MasterClock backed by system_clock (UTC) and steady_clock (monotonic).
// Copyright (c) 2025 RetroVue

#include "kitchensync/timing/MasterClock.h"

#include <chrono>
#include <memory>

namespace kitchensync::timing {

class SystemMasterClock : public MasterClock {
 public:
  SystemMasterClock() : monotonic_origin_(std::chrono::steady_clock::now()) {}

  int64_t now_utc_us() const override {
    const auto now = std::chrono::system_clock::now();
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch());
    return micros.count();
  }

  double now_monotonic_s() const override {
    const auto delta = std::chrono::steady_clock::now() - monotonic_origin_;
    return std::chrono::duration<double>(delta).count();
  }

 private:
  std::chrono::steady_clock::time_point monotonic_origin_;
};

std::shared_ptr<MasterClock> MakeSystemMasterClock() {
  return std::make_shared<SystemMasterClock>();
}

}  // namespace kitchensync::timing
