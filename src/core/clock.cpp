#include "uidkit/core/clock.h"

#include <thread>

namespace uidkit::core {

std::int64_t SystemClock::now_unix_millis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

std::int64_t ManualClock::now_unix_millis() {
  return now_millis_.load(std::memory_order_acquire);
}

void ManualClock::sleep_for(std::chrono::milliseconds duration) {
  slept_millis_.fetch_add(duration.count(), std::memory_order_relaxed);
  now_millis_.fetch_add(duration.count(), std::memory_order_acq_rel);
}

void ManualClock::set_millis(std::int64_t millis) {
  now_millis_.store(millis, std::memory_order_release);
}

void ManualClock::advance(std::chrono::milliseconds delta) {
  now_millis_.fetch_add(delta.count(), std::memory_order_acq_rel);
}

std::chrono::milliseconds ManualClock::total_slept() const {
  return std::chrono::milliseconds{slept_millis_.load(std::memory_order_relaxed)};
}

}  // namespace uidkit::core
