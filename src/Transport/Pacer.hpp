#ifndef HAUL_TRANSPORT_PACER_HPP_
#define HAUL_TRANSPORT_PACER_HPP_

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "utils/sleeper.hpp"

namespace haul {

struct PacerConfig {
  std::chrono::milliseconds minBackoff{400};
  std::chrono::milliseconds maxBackoff{5000};
  std::chrono::milliseconds floodSleep{30000};
  double jitter = 0.1;  // fraction, 0.0 - 1.0
};

/**
 * @brief Backoff calculator and hostile-response detector.
 *
 * backoff(n) = min(minBackoff * 2^n, maxBackoff) * U[1 - jitter, 1 + jitter].
 * Flood/IP-lock pages get a fixed floodSleep instead: quick retries only
 * extend the lock.
 */
class Pacer {
 public:
  explicit Pacer(PacerConfig config = PacerConfig(),
                 utils::Sleeper sleeper = nullptr);
  Pacer(const Pacer& other);
  Pacer& operator=(const Pacer& other);

  std::chrono::milliseconds backoff(int attempt) const;

  // Backoff for the current attempt counter, without advancing it.
  std::chrono::milliseconds nextBackoff() const;

  // Sleeps nextBackoff() and advances the attempt counter.
  void sleep();
  void reset();
  int attemptCount() const;

  static bool detectFloodOrLock(const std::string& body);

  // Seconds, or nullopt if the page carries no recognizable wait.
  static std::optional<double> parseWaitTime(const std::string& body);

  void handleFloodLock();

  // Sleeps wait + 1s when a wait in (0, maxAcceptable] is found.
  // Throws WaitTooLongError when the wait exceeds maxAcceptable.
  bool waitIfRequested(
      const std::string& body,
      std::chrono::seconds maxAcceptable = std::chrono::seconds(300));

  // Flood page -> flood sleep; wait page -> waitIfRequested.
  bool handleHostileResponse(const std::string& body);

  const PacerConfig& config() const { return config_; }
  void sleepFor(std::chrono::milliseconds d) const { sleeper_(d); }

 private:
  PacerConfig config_;
  utils::Sleeper sleeper_;
  std::atomic<int> attempt_{0};
};

}  // namespace haul

#endif  // HAUL_TRANSPORT_PACER_HPP_
