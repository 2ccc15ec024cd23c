// Repository: KitchenSync
// Component: Master Clock
// Purpose: Wall-clock and monotonic time base shared by every sync component.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_TIMING_MASTER_CLOCK_H_
#define KITCHENSYNC_TIMING_MASTER_CLOCK_H_

#include <cstdint>
#include <memory>

namespace kitchensync::timing {

// MasterClock provides monotonic and wall-clock time.
//
// Every interval the engine measures (tick receipt, liveness age, correction
// cooldown, session elapsed) is taken from now_monotonic_s(). Wall-clock time
// is only stamped onto outgoing messages and the session start_time.
class MasterClock {
 public:
  virtual ~MasterClock() = default;

  // Returns current UTC time in microseconds since Unix epoch.
  virtual int64_t now_utc_us() const = 0;

  // Returns current monotonic time in seconds relative to clock start.
  virtual double now_monotonic_s() const = 0;

  // Returns true if this is a fake/test clock.
  virtual bool is_fake() const { return false; }

  double now_utc_s() const { return static_cast<double>(now_utc_us()) / 1'000'000.0; }
};

std::shared_ptr<MasterClock> MakeSystemMasterClock();

}  // namespace kitchensync::timing

#endif  // KITCHENSYNC_TIMING_MASTER_CLOCK_H_
