#include "Transport/RateLimiter.hpp"

#include <algorithm>
#include <thread>

namespace haul {

RateLimiter::RateLimiter(double requestsPerSecond)
    : rate_(requestsPerSecond),
      capacity_(std::max(1.0, requestsPerSecond)),
      tokens_(std::max(1.0, requestsPerSecond)),
      last_(Clock::now()) {}

RateLimiter::Clock::duration RateLimiter::take() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = Clock::now();
  double elapsed = std::chrono::duration<double>(now - last_).count();
  last_ = now;
  tokens_ = std::min(capacity_, tokens_ + elapsed * rate_);

  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return Clock::duration::zero();
  }
  double missing = 1.0 - tokens_;
  auto wait = std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(missing / rate_));
  return std::max<Clock::duration>(wait, std::chrono::microseconds(1));
}

void RateLimiter::acquire() {
  if (rate_ <= 0) return;
  for (;;) {
    auto wait = take();
    if (wait == Clock::duration::zero()) return;
    std::this_thread::sleep_for(wait);
  }
}

bool RateLimiter::tryAcquire() {
  if (rate_ <= 0) return true;
  return take() == Clock::duration::zero();
}

}  // namespace haul
