#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace haul {
namespace utils {

// Injected wherever the engine waits (backoff, wait pages, throttling) so
// tests can record the delay instead of blocking.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper defaultSleeper() {
  return [](std::chrono::milliseconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
  };
}

}  // namespace utils
}  // namespace haul
