/**
 * @file retry.hpp
 * @brief Retry policy applied by the dispatcher to transient failures.
 */
#ifndef OCTOCLIENT_RETRY_HPP
#define OCTOCLIENT_RETRY_HPP

#include <chrono>

namespace octo {

/**
 * Capped exponential backoff with jitter.
 *
 * The delay before retry @c n (0 based) is
 * `min(base_delay * 2^n * (1 + jitter * u), max_delay)` with `u` drawn
 * uniformly from `[0, 1)`. A jitter below 1 keeps successive delays strictly
 * increasing until the cap.
 */
struct RetryPolicy {
  bool enabled{true};
  int max_attempts{3}; ///< Total sends, including the first.
  std::chrono::milliseconds base_delay{500};
  std::chrono::milliseconds max_delay{30000};
  double jitter{0.25};
  /// Upper bound on waits requested by the server for rate limits.
  std::chrono::milliseconds max_rate_limit_wait{60000};
};

/**
 * Compute the backoff before retry @p attempt.
 *
 * @param policy Policy supplying base, cap and jitter.
 * @param attempt Zero based retry index.
 * @param unit Jitter sample in `[0, 1)`.
 */
std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int attempt,
                                        double unit);

} // namespace octo

#endif // OCTOCLIENT_RETRY_HPP
