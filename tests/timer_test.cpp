#include "utils/timer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using haul::utils::Timer;
using std::chrono::milliseconds;

TEST(TimerTest, RunsOnceTasksInDeadlineOrder) {
  Timer timer;
  std::mutex mutex;
  std::vector<int> order;
  timer.start();
  timer.addOnceTask(milliseconds(60), [&]() {
    std::lock_guard<std::mutex> lock(mutex);
    order.push_back(2);
  });
  timer.addOnceTask(milliseconds(10), [&]() {
    std::lock_guard<std::mutex> lock(mutex);
    order.push_back(1);
  });

  std::this_thread::sleep_for(milliseconds(200));
  timer.stop();
  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(TimerTest, PeriodicTaskRepeatsUntilCancelled) {
  Timer timer;
  std::atomic<int> ticks{0};
  timer.start();
  auto id = timer.addPeriodicTask(milliseconds(0), milliseconds(10),
                                  [&]() { ++ticks; });

  std::this_thread::sleep_for(milliseconds(150));
  timer.cancelTask(id);
  std::this_thread::sleep_for(milliseconds(30));
  int seen = ticks.load();
  EXPECT_GE(seen, 3);

  std::this_thread::sleep_for(milliseconds(60));
  EXPECT_EQ(ticks.load(), seen);
  timer.stop();
}

TEST(TimerTest, CancelledOnceTaskNeverRuns) {
  Timer timer;
  std::atomic<bool> ran{false};
  timer.start();
  auto id = timer.addOnceTask(milliseconds(50), [&]() { ran = true; });
  timer.cancelTask(id);
  std::this_thread::sleep_for(milliseconds(120));
  timer.stop();
  EXPECT_FALSE(ran.load());
}

TEST(TimerTest, ThrowingCallbackKeepsTimerAlive) {
  Timer timer;
  std::atomic<int> calls{0};
  timer.start();
  timer.addOnceTask(milliseconds(0),
                    []() { throw std::runtime_error("callback failed"); });
  timer.addOnceTask(milliseconds(20), [&]() { ++calls; });
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_TRUE(timer.running());
  timer.stop();
  EXPECT_FALSE(timer.running());
  EXPECT_EQ(calls.load(), 1);
}

TEST(TimerTest, StopIsIdempotentAndRestartable) {
  Timer timer;
  timer.stop();
  timer.start();
  timer.stop();
  std::atomic<bool> ran{false};
  timer.start();
  timer.addOnceTask(milliseconds(0), [&]() { ran = true; });
  std::this_thread::sleep_for(milliseconds(50));
  timer.stop();
  EXPECT_TRUE(ran.load());
}
