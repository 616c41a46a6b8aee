#ifndef MACREPLAY_TIMING_TEST_CLOCK_H_
#define MACREPLAY_TIMING_TEST_CLOCK_H_

#include "macreplay/timing/Clock.h"

#include <atomic>
#include <cstdint>

namespace macreplay::timing {

// TestClock holds time still until a test moves it.
class TestClock : public Clock {
 public:
  explicit TestClock(int64_t start_time_us = 0);

  int64_t now_utc_us() const override;
  bool is_fake() const override;

  void SetNow(int64_t utc_us);
  void AdvanceMicroseconds(int64_t delta_us);
  void AdvanceSeconds(double delta_s);

  // Convenience for tests that think in seconds.
  void SetNowSeconds(int64_t utc_s) { SetNow(utc_s * 1'000'000); }

 private:
  std::atomic<int64_t> utc_us_;
};

}  // namespace macreplay::timing

#endif  // MACREPLAY_TIMING_TEST_CLOCK_H_
