#pragma once
#include <chrono>
#include <cstdint>

namespace rotalog
{

// Gate in front of the size check. Stat-ing the target on every line is too
// expensive, so a check is due only after `check_frequency` calls or
// `check_interval` of elapsed time, whichever comes first.
class RotationThrottle
{
 public:
  using Clock = std::chrono::steady_clock;

  RotationThrottle(uint64_t check_frequency, std::chrono::nanoseconds check_interval);

  // Pure predicate. A call count of zero is always due.
  bool ShouldCheck(uint64_t call_count, std::chrono::nanoseconds elapsed) const;

  // Counts one log call at `now`. Returns true when a size check is due; the
  // call counter and the last-check time are reset before returning true.
  // A throttle that has never fired treats its elapsed time as unbounded.
  bool OnCall(Clock::time_point now);

  uint64_t CallCount() const { return call_count_; }
  bool HasChecked() const { return has_checked_; }
  Clock::time_point LastCheck() const { return last_check_; }
  uint64_t FireCount() const { return fire_count_; }

 private:
  uint64_t check_frequency_;
  std::chrono::nanoseconds check_interval_;

  uint64_t call_count_ = 0;
  bool has_checked_ = false;
  Clock::time_point last_check_{};
  uint64_t fire_count_ = 0;
};

}  // namespace rotalog
