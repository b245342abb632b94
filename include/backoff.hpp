/**
 * @file backoff.hpp
 * @brief Exponential backoff applied after rate-limited fetches.
 */

#ifndef USAGEMONITOR_BACKOFF_HPP
#define USAGEMONITOR_BACKOFF_HPP

#include <chrono>

namespace umon {

/**
 * Tracks consecutive rate-limited attempts.
 *
 * Attempt `n` (1-based) waits `base * 2^(n-1)`, capped at `max`.
 */
class BackoffPolicy {
public:
  /**
   * @param base Delay after the first rate-limited attempt.
   * @param max Upper bound for any delay.
   */
  BackoffPolicy(std::chrono::milliseconds base = std::chrono::seconds(30),
                std::chrono::milliseconds max = std::chrono::seconds(300));

  /**
   * Record another rate-limited attempt.
   *
   * @return Delay to wait before retrying.
   */
  std::chrono::milliseconds on_rate_limited();

  /// Forget all recorded attempts.
  void reset() { attempt_ = 0; }

  /// Number of consecutive rate-limited attempts, zero when not backing off.
  int attempt() const { return attempt_; }

  bool active() const { return attempt_ > 0; }

  /// Delay for the current attempt, zero when not backing off.
  std::chrono::milliseconds current_delay() const;

private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds max_;
  int attempt_{0};
};

} // namespace umon

#endif // USAGEMONITOR_BACKOFF_HPP
