#pragma once

#include <algorithm>
#include <chrono>

namespace edgerun::util {

/*
  Absolute point on the steady clock shared by every step of one execution.

  Steps ask for Clamp(step_timeout) so no single step can outlive the
  overall budget.
*/
class Deadline {
 public:
  using Clock    = std::chrono::steady_clock;
  using Duration = std::chrono::milliseconds;

  explicit Deadline(Clock::time_point at) : at_(at) {
  }

  static Deadline After(Duration budget) {
    return Deadline(Clock::now() + budget);
  }

  Clock::time_point At() const {
    return at_;
  }

  bool Expired() const {
    return Clock::now() >= at_;
  }

  Duration Remaining() const {
    const auto left = std::chrono::duration_cast<Duration>(at_ - Clock::now());
    return std::max(left, Duration::zero());
  }

  Duration Clamp(Duration step_timeout) const {
    return std::min(step_timeout, Remaining());
  }

 private:
  Clock::time_point at_;
};

} // namespace edgerun::util
