#include "macreplay/timing/Clock.h"

#include <chrono>
#include <memory>

namespace macreplay::timing {

class SystemClock : public Clock {
 public:
  int64_t now_utc_us() const override {
    const auto now = std::chrono::system_clock::now();
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch());
    return micros.count();
  }
};

std::shared_ptr<Clock> MakeSystemClock() {
  return std::make_shared<SystemClock>();
}

}  // namespace macreplay::timing
