#pragma once

#include <atomic>
#include <cstdint>

namespace uusid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use a controllable clock.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return milliseconds since the Unix epoch (UTC).
  // Contract: thread-safe; consecutive calls may go backwards (callers handle regression).
  virtual std::int64_t now_unix_millis() = 0;

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

  std::int64_t now_unix_millis() override;
};

// Manual clock: returns a settable timestamp for deterministic tests.
// The time only moves when set() or advance() is called, so it can also model
// a frozen clock or a backwards jump.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t start_millis) : millis_(start_millis) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::int64_t now_unix_millis() override;

  void set(std::int64_t millis) { millis_.store(millis, std::memory_order_relaxed); }
  void advance(std::int64_t delta_millis) {
    millis_.fetch_add(delta_millis, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::int64_t> millis_;
};

}  // namespace uusid::core
