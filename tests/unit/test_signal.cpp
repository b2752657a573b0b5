/**
 * @file test_signal.cpp
 * @brief Unit tests for notification channels
 */

#include <bluewatch/signal.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bluewatch;

TEST(SignalTest, DeliversToEveryObserverInOrder) {
  Signal<int> signal("numbers");
  std::vector<std::string> calls;

  signal.subscribe([&](const int &n) { calls.push_back("a" + std::to_string(n)); });
  signal.subscribe([&](const int &n) { calls.push_back("b" + std::to_string(n)); });

  signal.emit(7);

  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0], "a7");
  EXPECT_EQ(calls[1], "b7");
}

TEST(SignalTest, NullHandlerIsIgnored) {
  Signal<> signal("empty");
  EXPECT_EQ(signal.subscribe(nullptr), 0u);
  EXPECT_EQ(signal.observer_count(), 0u);
  signal.emit();
}

TEST(SignalTest, Unsubscribe) {
  Signal<> signal("started");
  int count = 0;

  auto id = signal.subscribe([&] { ++count; });
  EXPECT_NE(id, 0u);

  signal.emit();
  EXPECT_TRUE(signal.unsubscribe(id));
  EXPECT_FALSE(signal.unsubscribe(id));
  signal.emit();

  EXPECT_EQ(count, 1);
}

TEST(SignalTest, ThrowingObserverDoesNotStopOthers) {
  Signal<int> signal("numbers");
  int delivered = 0;

  signal.subscribe([](const int &) { throw std::runtime_error("boom"); });
  signal.subscribe([&](const int &) { ++delivered; });

  EXPECT_NO_THROW(signal.emit(1));
  EXPECT_EQ(delivered, 1);
}

TEST(SignalTest, ObserverMayUnsubscribeItself) {
  Signal<> signal("started");
  int count = 0;
  SubscriptionId id = 0;

  id = signal.subscribe([&] {
    ++count;
    signal.unsubscribe(id);
  });

  signal.emit();
  signal.emit();

  EXPECT_EQ(count, 1);
  EXPECT_EQ(signal.observer_count(), 0u);
}

TEST(SignalTest, ClearRemovesAll) {
  Signal<> signal("started");
  signal.subscribe([] {});
  signal.subscribe([] {});
  EXPECT_EQ(signal.observer_count(), 2u);

  signal.clear();
  EXPECT_EQ(signal.observer_count(), 0u);
}
