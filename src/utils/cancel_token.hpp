#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace haul {
namespace utils {

/**
 * @brief Cooperative cancellation flag.
 *
 * Checked by the transfer loop at chunk boundaries; an in-flight read is
 * never interrupted, so cancellation latency is about one chunk.
 */
class CancelToken {
 public:
  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // 等待指定时长，被取消时提前返回 true
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled(); });
  }

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace utils
}  // namespace haul
