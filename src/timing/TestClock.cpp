#include "timing/TestClock.h"

#include <cmath>

namespace macreplay::timing {

namespace {
constexpr double kMillion = 1'000'000.0;
}

TestClock::TestClock(int64_t start_time_us) : utc_us_(start_time_us) {}

int64_t TestClock::now_utc_us() const {
  return utc_us_.load(std::memory_order_acquire);
}

bool TestClock::is_fake() const { return true; }

void TestClock::SetNow(int64_t utc_us) {
  utc_us_.store(utc_us, std::memory_order_release);
}

void TestClock::AdvanceMicroseconds(int64_t delta_us) {
  utc_us_.fetch_add(delta_us, std::memory_order_acq_rel);
}

void TestClock::AdvanceSeconds(double delta_s) {
  AdvanceMicroseconds(static_cast<int64_t>(std::llround(delta_s * kMillion)));
}

}  // namespace macreplay::timing
