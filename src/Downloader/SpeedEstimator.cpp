#include "Downloader/SpeedEstimator.hpp"

namespace haul {

void SpeedEstimator::start(uint64_t downloaded, Clock::time_point now) {
  last_ = Sample{downloaded, now};
}

bool SpeedEstimator::update(uint64_t downloaded, Clock::time_point now) {
  if (!last_) {
    last_ = Sample{downloaded, now};
    return false;
  }
  double elapsed = std::chrono::duration<double>(now - last_->at).count();
  if (elapsed <= 0.0) return false;

  uint64_t delta = downloaded > last_->bytes ? downloaded - last_->bytes : 0;
  double instant = static_cast<double>(delta) / elapsed;
  if (speed_) {
    speed_ = alpha_ * instant + (1.0 - alpha_) * *speed_;
  } else {
    speed_ = instant;
  }
  last_ = Sample{downloaded, now};
  return true;
}

double SpeedEstimator::eta(uint64_t downloaded, uint64_t total) const {
  if (!speed_ || *speed_ <= 0.0 || total <= downloaded) return 0.0;
  return static_cast<double>(total - downloaded) / *speed_;
}

void SpeedEstimator::reset() {
  last_.reset();
  speed_.reset();
}

}  // namespace haul
