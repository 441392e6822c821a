#include "retry.hpp"
#include <algorithm>
#include <cmath>

namespace octo {

std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int attempt,
                                        double unit) {
  const double cap = static_cast<double>(policy.max_delay.count());
  const double jitter = std::clamp(policy.jitter, 0.0, 0.999);
  unit = std::clamp(unit, 0.0, 0.999999);
  double delay = static_cast<double>(policy.base_delay.count()) *
                 std::ldexp(1.0, std::clamp(attempt, 0, 62)) *
                 (1.0 + jitter * unit);
  return std::chrono::milliseconds(
      static_cast<long long>(std::min(delay, cap)));
}

} // namespace octo
