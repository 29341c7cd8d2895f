#include "orchestra/core/lockfree_queue.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace orchestra;

TEST(LockfreeQueueTest, BasicPushPop) {
  BoundedMPSCQueue<int> queue(64);

  EXPECT_TRUE(queue.empty());
  EXPECT_TRUE(queue.push(42));
  EXPECT_FALSE(queue.empty());

  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(LockfreeQueueTest, CapacityRoundsUpToPowerOfTwo) {
  EXPECT_EQ(BoundedMPSCQueue<int>(5).capacity(), 8u);
  EXPECT_EQ(BoundedMPSCQueue<int>(64).capacity(), 64u);
  EXPECT_EQ(BoundedMPSCQueue<int>(0).capacity(), 2u);
}

TEST(LockfreeQueueTest, RejectsPushWhenFull) {
  BoundedMPSCQueue<int> queue(8);

  for (int i = 0; i < 8; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_FALSE(queue.push(8));

  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 0);
  EXPECT_TRUE(queue.push(8));
}

TEST(LockfreeQueueTest, PreservesFifoOrderAcrossWrap) {
  BoundedMPSCQueue<int> queue(4);

  for (int round = 0; round < 10; ++round) {
    for (int i = 0; i < 3; ++i) {
      ASSERT_TRUE(queue.push(round * 10 + i));
    }
    for (int i = 0; i < 3; ++i) {
      auto value = queue.try_pop();
      ASSERT_TRUE(value.has_value());
      EXPECT_EQ(*value, round * 10 + i);
    }
  }
}

TEST(LockfreeQueueTest, MoveOnlyElements) {
  BoundedMPSCQueue<std::unique_ptr<std::string>> queue(4);

  ASSERT_TRUE(queue.push(std::make_unique<std::string>("log line")));
  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(**value, "log line");
}

TEST(LockfreeQueueTest, DestructorReleasesPendingElements) {
  auto tracked = std::make_shared<int>(7);
  {
    BoundedMPSCQueue<std::shared_ptr<int>> queue(4);
    ASSERT_TRUE(queue.push(tracked));
    ASSERT_TRUE(queue.push(tracked));
    EXPECT_EQ(tracked.use_count(), 3);
  }
  EXPECT_EQ(tracked.use_count(), 1);
}

TEST(LockfreeQueueTest, ConcurrentProducersSingleConsumer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 5000;
  BoundedMPSCQueue<int> queue(256);
  std::atomic<int> finished{0};

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 1; i <= kPerProducer; ++i) {
        queue.push_blocking(p * kPerProducer + i);
      }
      finished.fetch_add(1);
    });
  }

  long long sum = 0;
  int received = 0;
  while (finished.load() < kProducers || !queue.empty()) {
    if (auto value = queue.try_pop()) {
      sum += *value;
      ++received;
    } else {
      std::this_thread::yield();
    }
  }
  for (auto& t : producers) {
    t.join();
  }
  while (auto value = queue.try_pop()) {
    sum += *value;
    ++received;
  }

  constexpr long long kTotal = kProducers * kPerProducer;
  EXPECT_EQ(received, kTotal);
  EXPECT_EQ(sum, kTotal * (kTotal + 1) / 2);
}
