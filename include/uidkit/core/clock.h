#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace uidkit::core {

// Abstract clock interface for time injection.
// Allows production code to use wall-clock time while tests simulate clock anomalies.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current wall-clock time in milliseconds since the Unix epoch.
  // Contract: may move backward between calls (NTP steps, manual adjustment).
  virtual std::int64_t now_unix_millis() = 0;

  // Block the calling thread for at least the given duration.
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: reads std::chrono::system_clock and sleeps the calling thread.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_millis() override;
  void sleep_for(std::chrono::milliseconds duration) override;
};

// Manual clock: time only moves when told to.
// sleep_for() advances the clock by the requested duration instead of blocking,
// so a caller waiting out a backward jump returns immediately with time caught up.
// Thread-safe.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t start_millis) : now_millis_(start_millis) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomics)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::int64_t now_unix_millis() override;
  void sleep_for(std::chrono::milliseconds duration) override;

  void set_millis(std::int64_t millis);
  void advance(std::chrono::milliseconds delta);

  // Total time requested through sleep_for() since construction.
  [[nodiscard]] std::chrono::milliseconds total_slept() const;

 private:
  std::atomic<std::int64_t> now_millis_;
  std::atomic<std::int64_t> slept_millis_{0};
};

}  // namespace uidkit::core
