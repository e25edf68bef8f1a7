#include "rotalog/rotation_throttle.hpp"

namespace rotalog
{

RotationThrottle::RotationThrottle(uint64_t check_frequency,
                                   std::chrono::nanoseconds check_interval)
    : check_frequency_(check_frequency), check_interval_(check_interval)
{
}

bool RotationThrottle::ShouldCheck(uint64_t call_count, std::chrono::nanoseconds elapsed) const
{
  return call_count == 0 || call_count >= check_frequency_ || elapsed >= check_interval_;
}

bool RotationThrottle::OnCall(Clock::time_point now)
{
  ++call_count_;
  std::chrono::nanoseconds elapsed =
      has_checked_ ? std::chrono::duration_cast<std::chrono::nanoseconds>(now - last_check_)
                   : std::chrono::nanoseconds::max();

  if (!ShouldCheck(call_count_, elapsed))
  {
    return false;
  }

  call_count_ = 0;
  last_check_ = now;
  has_checked_ = true;
  ++fire_count_;
  return true;
}

}  // namespace rotalog
