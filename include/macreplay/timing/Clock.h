// Repository: MacReplay-gateway
// Component: Clock
// Purpose: Wall-clock source for cache ageing, EPG cutoffs and session start times.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_TIMING_CLOCK_H_
#define MACREPLAY_TIMING_CLOCK_H_

#include <cstdint>
#include <memory>

namespace macreplay::timing {

// Clock provides UTC wall-clock time. The artifact cache and the occupancy
// table read time only through this interface so tests can pin it.
class Clock {
 public:
  virtual ~Clock() = default;

  // Returns current UTC time in microseconds since Unix epoch.
  virtual int64_t now_utc_us() const = 0;

  // Returns current UTC time in whole seconds since Unix epoch.
  int64_t now_utc_s() const { return now_utc_us() / 1'000'000; }

  // Returns true if this is a fake/test clock (for testing only).
  virtual bool is_fake() const { return false; }
};

std::shared_ptr<Clock> MakeSystemClock();

}  // namespace macreplay::timing

#endif  // MACREPLAY_TIMING_CLOCK_H_
