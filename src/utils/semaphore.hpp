#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace haul {
namespace utils {

class Semaphore {
 public:
  explicit Semaphore(std::size_t count) : count_(count) {}
  Semaphore(const Semaphore&) = delete;
  Semaphore& operator=(const Semaphore&) = delete;

  void acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return count_ > 0; });
    --count_;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++count_;
    }
    cv_.notify_one();
  }

  std::size_t available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
  }

 private:
  std::size_t count_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

class SemaphoreGuard {
 public:
  explicit SemaphoreGuard(Semaphore& sem) : sem_(sem) { sem_.acquire(); }
  ~SemaphoreGuard() { sem_.release(); }
  SemaphoreGuard(const SemaphoreGuard&) = delete;
  SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

 private:
  Semaphore& sem_;
};

}  // namespace utils
}  // namespace haul
