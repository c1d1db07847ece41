#pragma once

#include "snotes/core/time.h"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace snotes::core {

// Abstract clock interface for timestamp injection.
// Production code reads the system wall clock; tests drive time explicitly so that
// expiry and clock-regression paths are reachable without sleeping.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current UTC instant, millisecond precision.
  virtual Timestamp now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// Manual clock: time only moves when told to. May be moved backwards, which is how
// tests simulate an NTP step.
// Thread-safe: the current instant is held in an atomic.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(Timestamp start) : millis_(to_unix_millis(start)) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  Timestamp now() override;

  void set(Timestamp ts);
  void advance(std::chrono::milliseconds delta);

 private:
  std::atomic<std::int64_t> millis_;
};

}  // namespace snotes::core
