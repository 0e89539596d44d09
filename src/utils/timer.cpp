#include "utils/timer.hpp"

#include "utils/logger.hpp"

namespace haul {
namespace utils {

Timer::Timer() : nextId_(1), running_(false) {}
Timer::~Timer() { stop(); }

Timer::TaskId Timer::push(TimerTask task) {
  TaskId id = task.id;
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    taskQueue_.push(std::move(task));
  }
  tasksCv_.notify_one();
  return id;
}

Timer::TaskId Timer::addOnceTask(std::chrono::milliseconds delay,
                                 std::function<void()> callback) {
  TaskId id;
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    id = nextId_++;
  }
  auto execution_time = std::chrono::steady_clock::now() + delay;
  return push(TimerTask(id, execution_time, std::move(callback)));
}

Timer::TaskId Timer::addPeriodicTask(std::chrono::milliseconds delay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> callback) {
  TaskId id;
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    id = nextId_++;
  }
  auto execution_time = std::chrono::steady_clock::now() + delay;
  return push(TimerTask(id, execution_time, std::move(callback), true, period));
}

void Timer::cancelTask(TaskId id) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  cancelled_.insert(id);
}

bool Timer::running() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  return running_;
}

void Timer::start() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (running_) return;  // Already running
    running_ = true;
  }

  timerThread_ = std::thread([this]() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    while (running_) {
      if (taskQueue_.empty()) {
        tasksCv_.wait(lock,
                      [this]() { return !taskQueue_.empty() || !running_; });
        continue;
      }

      auto now = std::chrono::steady_clock::now();
      auto nextTask = taskQueue_.top();

      if (cancelled_.count(nextTask.id)) {
        taskQueue_.pop();
        cancelled_.erase(nextTask.id);
        continue;
      }

      if (nextTask.execTimestamp <= now) {
        taskQueue_.pop();

        if (nextTask.isPeriodic && running_) {
          TimerTask again = nextTask;
          again.execTimestamp = now + again.period;
          taskQueue_.push(std::move(again));
        }

        lock.unlock();  // Unlock before executing the callback
        try {
          nextTask.callback();
        } catch (const std::exception& e) {
          LOG(ERROR) << "Timer task " << nextTask.id << " failed: " << e.what();
        }
        lock.lock();
      } else {
        tasksCv_.wait_until(lock, nextTask.execTimestamp, [this, &nextTask]() {
          return !running_ ||
                 (!taskQueue_.empty() &&
                  taskQueue_.top().execTimestamp < nextTask.execTimestamp);
        });
      }
    }
  });
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    tasksCv_.notify_all();  // Notify the thread to wake up and exit
  }

  if (timerThread_.joinable()) {
    timerThread_.join();
  }
}

}  // namespace utils
}  // namespace haul
