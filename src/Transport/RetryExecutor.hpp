#ifndef HAUL_TRANSPORT_RETRY_EXECUTOR_HPP_
#define HAUL_TRANSPORT_RETRY_EXECUTOR_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "Transport/Pacer.hpp"
#include "Transport/RateLimiter.hpp"
#include "Transport/Transport.hpp"

namespace haul {

struct RetryConfig {
  int maxRetries = 3;  // attempts = maxRetries + 1
  std::chrono::seconds maxDelay{60};
  std::chrono::seconds maxRetryAfter{60};
};

/**
 * @brief The single retry loop every transport request goes through.
 *
 *  - 429: wait Retry-After (capped), else flood sleep if the body says so,
 *    else backoff; RateLimitedError once exhausted.
 *  - other 4xx: HttpStatusError at once.
 *  - 5xx / NetworkError: backoff 2^n s with jitter, capped;
 *    RetriesExhaustedError once exhausted.
 * Other exceptions from the attempt propagate untouched.
 */
class RetryExecutor {
 public:
  using Attempt = std::function<HttpResponse()>;

  RetryExecutor(RetryConfig config, std::shared_ptr<RateLimiter> limiter,
                utils::Sleeper sleeper = nullptr);

  HttpResponse execute(const std::string& what, const Attempt& attempt);

  // Delta-seconds or HTTP-date; nullopt when unparseable.
  static std::optional<std::chrono::seconds> parseRetryAfter(
      const std::string& value);

  const RetryConfig& config() const { return config_; }
  const Pacer& pacer() const { return pacer_; }

 private:
  RetryConfig config_;
  std::shared_ptr<RateLimiter> limiter_;
  Pacer pacer_;
};

}  // namespace haul

#endif  // HAUL_TRANSPORT_RETRY_EXECUTOR_HPP_
