#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "services/publish/bounded_queue.h"
#include "services/publish/fanout_channel.h"

using namespace concmon;

namespace {

FanoutMessage numbered(int i) {
  return FanoutMessage{"loop", "conductivity", static_cast<double>(i),
                       TimePoint(std::chrono::seconds(i))};
}

}  // namespace

TEST(BoundedQueueTest, KeepsTheMostRecentEntriesWhenFull) {
  const std::size_t K = 8;
  const int M = 5;
  BoundedQueue<int> queue(K);

  int dropped_pushes = 0;
  for (int i = 0; i < static_cast<int>(K) + M; ++i) {
    if (!queue.push(i)) ++dropped_pushes;
  }

  EXPECT_EQ(queue.size(), K);
  EXPECT_EQ(queue.dropped(), static_cast<uint64_t>(M));
  EXPECT_EQ(dropped_pushes, M);

  std::vector<int> out;
  EXPECT_EQ(queue.drain(out), K);
  ASSERT_EQ(out.size(), K);
  for (std::size_t i = 0; i < K; ++i) {
    EXPECT_EQ(out[i], M + static_cast<int>(i));
  }
  EXPECT_TRUE(queue.empty());
}

TEST(BoundedQueueTest, TryPopIsFifo) {
  BoundedQueue<std::string> queue(3);
  queue.push("a");
  queue.push("b");
  std::string item;
  ASSERT_TRUE(queue.tryPop(item));
  EXPECT_EQ(item, "a");
  ASSERT_TRUE(queue.tryPop(item));
  EXPECT_EQ(item, "b");
  EXPECT_FALSE(queue.tryPop(item));
}

TEST(BoundedQueueTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST(FanoutChannelTest, EverySubscriberGetsEveryMessageInOrder) {
  FanoutChannel channel;
  auto display = channel.subscribe("display", 16);
  auto publisher = channel.subscribe("publisher", 16);
  EXPECT_EQ(channel.subscriberCount(), 2u);

  for (int i = 0; i < 5; ++i) channel.publish(numbered(i));

  for (auto& sub : {display, publisher}) {
    std::vector<FanoutMessage> out;
    sub->drain(out);
    ASSERT_EQ(out.size(), 5u);
    for (int i = 0; i < 5; ++i) {
      EXPECT_EQ(std::get<double>(out[i].value), static_cast<double>(i));
    }
  }
}

TEST(FanoutChannelTest, SlowSubscriberOnlyLosesItsOwnOldest) {
  FanoutChannel channel;
  auto slow = channel.subscribe("slow", 4);
  auto fast = channel.subscribe("fast", 64);

  for (int i = 0; i < 10; ++i) channel.publish(numbered(i));

  EXPECT_EQ(slow->size(), 4u);
  EXPECT_EQ(fast->size(), 10u);
  EXPECT_EQ(channel.droppedTotal(), 6u);

  FanoutMessage first;
  ASSERT_TRUE(slow->tryPop(first));
  EXPECT_EQ(std::get<double>(first.value), 6.0);
}

TEST(FanoutChannelTest, PublishNeverWaitsForAConsumer) {
  FanoutChannel channel;
  auto never_drained = channel.subscribe("stuck", 2);

  std::atomic<bool> done{false};
  std::thread producer([&] {
    for (int i = 0; i < 10000; ++i) channel.publish(numbered(i));
    done = true;
  });
  producer.join();

  EXPECT_TRUE(done);
  EXPECT_EQ(never_drained->size(), 2u);
  EXPECT_EQ(never_drained->dropped(), 9998u);
}

TEST(FanoutChannelTest, ValueToString) {
  EXPECT_EQ(fanoutValueToString(FanoutValue(true)), "ON");
  EXPECT_EQ(fanoutValueToString(FanoutValue(false)), "OFF");
  EXPECT_EQ(fanoutValueToString(FanoutValue(std::string("rs485 OK"))),
            "rs485 OK");
  EXPECT_EQ(fanoutValueToString(FanoutValue(1.5)), "1.5");
}
