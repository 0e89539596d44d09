#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "utils/logger.hpp"

namespace haul {
namespace utils {

/**
 * @brief Named-topic publish/subscribe.
 *
 * emit() calls subscribers synchronously on the emitting thread, in
 * subscription order, with the subscriber list unlocked, so a callback may
 * subscribe or unsubscribe. A subscriber that throws is logged and skipped;
 * the remaining subscribers still run.
 */
template <typename Event>
class EventBus {
 public:
  using Callback = std::function<void(const Event&)>;
  using SubscriptionId = uint64_t;

  SubscriptionId subscribe(const std::string& topic, Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = ++nextId_;
    subscribers_[topic].emplace_back(id, std::move(callback));
    return id;
  }

  // False when `id` is not subscribed to `topic`.
  bool unsubscribe(const std::string& topic, SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(topic);
    if (it == subscribers_.end()) return false;
    auto& list = it->second;
    for (auto entry = list.begin(); entry != list.end(); ++entry) {
      if (entry->first == id) {
        list.erase(entry);
        return true;
      }
    }
    return false;
  }

  void emit(const std::string& topic, const Event& event) const {
    std::vector<std::pair<SubscriptionId, Callback>> targets;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = subscribers_.find(topic);
      if (it == subscribers_.end()) return;
      targets = it->second;
    }
    for (const auto& target : targets) {
      try {
        target.second(event);
      } catch (const std::exception& e) {
        LOG(ERROR) << "Subscriber " << target.first << " of '" << topic
                   << "' failed: " << e.what();
      }
    }
  }

  size_t subscriberCount(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(topic);
    return it == subscribers_.end() ? 0 : it->second.size();
  }

 private:
  mutable std::mutex mutex_;
  SubscriptionId nextId_ = 0;
  std::map<std::string, std::vector<std::pair<SubscriptionId, Callback>>>
      subscribers_;
};

}  // namespace utils
}  // namespace haul
