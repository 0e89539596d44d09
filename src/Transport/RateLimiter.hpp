#ifndef HAUL_TRANSPORT_RATE_LIMITER_HPP_
#define HAUL_TRANSPORT_RATE_LIMITER_HPP_

#include <chrono>
#include <mutex>

namespace haul {

/**
 * @brief Token bucket shared by every request the process makes.
 *
 * Refills `rate` tokens per second up to a burst of max(1, rate). A rate
 * of zero or less disables limiting.
 */
class RateLimiter {
 public:
  explicit RateLimiter(double requestsPerSecond);

  void acquire();
  bool tryAcquire();

  double rate() const { return rate_; }

 private:
  using Clock = std::chrono::steady_clock;

  // Returns how long to wait for the next token; zero if one was taken.
  Clock::duration take();

  const double rate_;
  const double capacity_;
  double tokens_;
  Clock::time_point last_;
  std::mutex mutex_;
};

}  // namespace haul

#endif  // HAUL_TRANSPORT_RATE_LIMITER_HPP_
