#ifndef HAUL_DOWNLOADER_SPEED_ESTIMATOR_HPP_
#define HAUL_DOWNLOADER_SPEED_ESTIMATOR_HPP_

#include <chrono>
#include <cstdint>
#include <optional>

namespace haul {

/**
 * @brief Exponentially smoothed transfer rate.
 *
 * The first measured interval sets the speed directly; later ones blend in
 * with weight alpha. "No sample yet" and "zero speed" are kept apart by
 * holding both the last sample and the speed as optionals.
 */
class SpeedEstimator {
 public:
  using Clock = std::chrono::steady_clock;

  explicit SpeedEstimator(double alpha = 0.3) : alpha_(alpha) {}

  // Sets the baseline (e.g. the resume offset) without producing a speed.
  void start(uint64_t downloaded, Clock::time_point now = Clock::now());

  // Returns false when skipped: no baseline yet, or no time has passed.
  bool update(uint64_t downloaded, Clock::time_point now = Clock::now());

  std::optional<double> speed() const { return speed_; }

  // (total - downloaded) / speed, 0 when either is unknown.
  double eta(uint64_t downloaded, uint64_t total) const;

  void reset();

 private:
  struct Sample {
    uint64_t bytes;
    Clock::time_point at;
  };

  double alpha_;
  std::optional<Sample> last_;
  std::optional<double> speed_;
};

}  // namespace haul

#endif  // HAUL_DOWNLOADER_SPEED_ESTIMATOR_HPP_
