#include "utils/event_bus.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using haul::utils::EventBus;

TEST(EventBusTest, DeliversToTopicSubscribersInOrder) {
  EventBus<int> bus;
  std::vector<std::string> seen;
  bus.subscribe("a", [&](const int& v) { seen.push_back("a1:" + std::to_string(v)); });
  bus.subscribe("b", [&](const int& v) { seen.push_back("b:" + std::to_string(v)); });
  bus.subscribe("a", [&](const int& v) { seen.push_back("a2:" + std::to_string(v)); });

  bus.emit("a", 7);
  bus.emit("nobody", 1);
  EXPECT_EQ(seen, (std::vector<std::string>{"a1:7", "a2:7"}));
  EXPECT_EQ(bus.subscriberCount("a"), 2u);
  EXPECT_EQ(bus.subscriberCount("nobody"), 0u);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
  EventBus<int> bus;
  int calls = 0;
  auto id = bus.subscribe("a", [&](const int&) { ++calls; });
  bus.emit("a", 1);
  EXPECT_TRUE(bus.unsubscribe("a", id));
  EXPECT_FALSE(bus.unsubscribe("a", id));
  EXPECT_FALSE(bus.unsubscribe("other", id));
  bus.emit("a", 2);
  EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, ThrowingSubscriberDoesNotStopOthers) {
  EventBus<std::string> bus;
  std::vector<std::string> seen;
  bus.subscribe("e", [](const std::string&) {
    throw std::runtime_error("subscriber broke");
  });
  bus.subscribe("e", [&](const std::string& v) { seen.push_back(v); });

  EXPECT_NO_THROW(bus.emit("e", "x"));
  EXPECT_NO_THROW(bus.emit("e", "y"));
  EXPECT_EQ(seen, (std::vector<std::string>{"x", "y"}));
}

TEST(EventBusTest, CallbackMayUnsubscribeItself) {
  EventBus<int> bus;
  int calls = 0;
  EventBus<int>::SubscriptionId id = 0;
  id = bus.subscribe("a", [&](const int&) {
    ++calls;
    bus.unsubscribe("a", id);
  });
  bus.emit("a", 1);
  bus.emit("a", 2);
  EXPECT_EQ(calls, 1);
}
