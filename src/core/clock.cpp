#include "uusid/core/clock.h"

#include <chrono>

namespace uusid::core {

std::int64_t SystemClock::now_unix_millis() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::int64_t ManualClock::now_unix_millis() {
  return millis_.load(std::memory_order_relaxed);
}

}  // namespace uusid::core
