#include "snotes/core/clock.h"

namespace snotes::core {

Timestamp SystemClock::now() {
  return now_utc();
}

Timestamp ManualClock::now() {
  return from_unix_millis(millis_.load(std::memory_order_acquire));
}

void ManualClock::set(const Timestamp ts) {
  millis_.store(to_unix_millis(ts), std::memory_order_release);
}

void ManualClock::advance(const std::chrono::milliseconds delta) {
  millis_.fetch_add(delta.count(), std::memory_order_acq_rel);
}

}  // namespace snotes::core
