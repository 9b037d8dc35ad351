#pragma once

#include <cstdint>
#include <string>

namespace granddao {

// Wall-clock source in milliseconds since the Unix epoch.
//
// Offline catch-up compares a persisted timestamp against now_ms(), so the
// clock has to survive process restarts (system_clock, not steady_clock).
class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::int64_t now_ms() const = 0;
};

class SystemClock final : public Clock {
 public:
  std::int64_t now_ms() const override;
};

// Test clock that only moves when told to.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(std::int64_t start_ms = 0) : ms_(start_ms) {}

  std::int64_t now_ms() const override { return ms_; }
  void set_ms(std::int64_t ms) { ms_ = ms; }
  void advance_ms(std::int64_t delta) { ms_ += delta; }

 private:
  std::int64_t ms_{0};
};

// Format a duration in whole seconds for status lines:
//   45 -> "45s", 200 -> "3m 20s", 7500 -> "2h 05m".
std::string format_duration(std::int64_t seconds);

} // namespace granddao
