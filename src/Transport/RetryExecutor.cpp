#include "Transport/RetryExecutor.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace haul {

namespace {

PacerConfig transportPacerConfig(const RetryConfig& config) {
  PacerConfig pc;
  pc.minBackoff = std::chrono::milliseconds(1000);
  pc.maxBackoff = config.maxDelay;
  pc.jitter = 0.1;
  return pc;
}

}  // namespace

RetryExecutor::RetryExecutor(RetryConfig config,
                             std::shared_ptr<RateLimiter> limiter,
                             utils::Sleeper sleeper)
    : config_(config),
      limiter_(std::move(limiter)),
      pacer_(transportPacerConfig(config), std::move(sleeper)) {
  config_.maxRetries = std::max(config_.maxRetries, 0);
}

std::optional<std::chrono::seconds> RetryExecutor::parseRetryAfter(
    const std::string& value) {
  size_t b = 0;
  while (b < value.size() && std::isspace(static_cast<unsigned char>(value[b]))) {
    ++b;
  }
  std::string v = value.substr(b);
  while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) {
    v.pop_back();
  }
  if (v.empty()) return std::nullopt;

  if (std::all_of(v.begin(), v.end(),
                  [](unsigned char c) { return std::isdigit(c); })) {
    if (v.size() > 9) return std::chrono::seconds(999999999);
    return std::chrono::seconds(std::stol(v));
  }

  // HTTP-date, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
  std::tm tm{};
  if (strptime(v.c_str(), "%a, %d %b %Y %H:%M:%S", &tm) == nullptr) {
    return std::nullopt;
  }
  std::time_t when = timegm(&tm);
  std::time_t now = std::time(nullptr);
  return std::chrono::seconds(when > now ? when - now : 0);
}

HttpResponse RetryExecutor::execute(const std::string& what,
                                    const Attempt& attempt) {
  const int maxRetries = config_.maxRetries;
  auto capped = [this](std::chrono::milliseconds d) {
    return std::min<std::chrono::milliseconds>(d, config_.maxDelay);
  };

  std::optional<int> lastRetryAfter;
  std::string lastError;
  bool rateLimited = false;

  for (int n = 0; n <= maxRetries; ++n) {
    if (limiter_) limiter_->acquire();

    HttpResponse response;
    try {
      response = attempt();
    } catch (const NetworkError& e) {
      rateLimited = false;
      lastError = e.what();
      if (n == maxRetries) break;
      auto delay = capped(pacer_.backoff(n));
      LOG(WARN) << what << " failed: " << e.what() << "; retry " << n + 1
                << "/" << maxRetries << " in " << delay.count() << "ms";
      pacer_.sleepFor(delay);
      continue;
    }

    if (response.status == 429) {
      rateLimited = true;
      lastError = "429 Too Many Requests";
      auto retryAfter = parseRetryAfter(response.header("retry-after"));
      if (retryAfter) {
        retryAfter = std::min(*retryAfter, config_.maxRetryAfter);
        lastRetryAfter = static_cast<int>(retryAfter->count());
      }
      if (n == maxRetries) break;

      if (retryAfter) {
        LOG(WARN) << what << " rate limited, Retry-After "
                  << retryAfter->count() << "s";
        pacer_.sleepFor(*retryAfter);
      } else if (Pacer::detectFloodOrLock(response.body)) {
        pacer_.handleFloodLock();
      } else {
        auto delay = capped(pacer_.backoff(n));
        LOG(WARN) << what << " rate limited, backing off " << delay.count()
                  << "ms";
        pacer_.sleepFor(delay);
      }
      continue;
    }

    if (response.status >= 500) {
      rateLimited = false;
      lastError = std::to_string(response.status) + " " +
                  HttpStatusError::reasonPhrase(response.status);
      if (n == maxRetries) break;
      if (Pacer::detectFloodOrLock(response.body)) {
        pacer_.handleFloodLock();
      } else {
        auto delay = capped(pacer_.backoff(n));
        LOG(WARN) << what << " got " << lastError << "; retry " << n + 1 << "/"
                  << maxRetries << " in " << delay.count() << "ms";
        pacer_.sleepFor(delay);
      }
      continue;
    }

    if (response.status >= 400) {
      throw HttpStatusError(response.status, response.body);
    }
    return response;
  }

  const std::string attempts = std::to_string(maxRetries + 1);
  if (rateLimited) {
    throw RateLimitedError(
        what + ": rate limited, retries exhausted after " + attempts +
            " attempts",
        lastRetryAfter);
  }
  throw RetriesExhaustedError(what + ": retries exhausted after " + attempts +
                              " attempts: " + lastError);
}

}  // namespace haul
