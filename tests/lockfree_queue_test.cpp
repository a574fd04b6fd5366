#include "adminq/core/lockfree_queue.hpp"
#include "adminq/util/log.hpp"

#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace adminq;

TEST(BoundedMPSCQueueTest, Capacity_RoundsUpToPowerOfTwo) {
  BoundedMPSCQueue<int> q(5);
  EXPECT_EQ(q.capacity(), 8u);

  BoundedMPSCQueue<int> tiny(0);
  EXPECT_EQ(tiny.capacity(), 2u);
}

TEST(BoundedMPSCQueueTest, PushPop_IsFifo) {
  BoundedMPSCQueue<int> q(4);
  EXPECT_TRUE(q.empty());

  EXPECT_TRUE(q.push(1));
  EXPECT_TRUE(q.push(2));
  EXPECT_TRUE(q.push(3));
  EXPECT_FALSE(q.empty());

  EXPECT_EQ(q.try_pop(), 1);
  EXPECT_EQ(q.try_pop(), 2);
  EXPECT_EQ(q.try_pop(), 3);
  EXPECT_FALSE(q.try_pop().has_value());
  EXPECT_TRUE(q.empty());
}

TEST(BoundedMPSCQueueTest, Push_WhenFull_ReturnsFalse) {
  BoundedMPSCQueue<int> q(2);
  EXPECT_TRUE(q.push(1));
  EXPECT_TRUE(q.push(2));
  EXPECT_FALSE(q.push(3));

  EXPECT_EQ(q.try_pop(), 1);
  EXPECT_TRUE(q.push(3));
}

TEST(BoundedMPSCQueueTest, MoveOnlyElements) {
  BoundedMPSCQueue<std::unique_ptr<std::string>> q(4);
  EXPECT_TRUE(q.push(std::make_unique<std::string>("line")));

  auto v = q.try_pop();
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(**v, "line");
}

TEST(BoundedMPSCQueueTest, Destructor_ReleasesRemainingElements) {
  auto tracked = std::make_shared<int>(0);
  {
    BoundedMPSCQueue<std::shared_ptr<int>> q(4);
    EXPECT_TRUE(q.push(tracked));
    EXPECT_TRUE(q.push(tracked));
    EXPECT_EQ(tracked.use_count(), 3);
  }
  EXPECT_EQ(tracked.use_count(), 1);
}

TEST(BoundedMPSCQueueTest, ConcurrentProducers_DeliverEveryItemOnce) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 5000;
  BoundedMPSCQueue<int> q(1024);

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        while (!q.push(p * kPerProducer + i)) {
          std::this_thread::yield();
        }
      }
    });
  }

  std::set<int> seen;
  while (seen.size() < static_cast<std::size_t>(kProducers * kPerProducer)) {
    if (auto v = q.try_pop()) {
      EXPECT_TRUE(seen.insert(*v).second);
    } else {
      std::this_thread::yield();
    }
  }
  for (auto& t : producers) {
    t.join();
  }
  EXPECT_TRUE(q.empty());
}

TEST(LogLevelTest, ParseLevel) {
  EXPECT_EQ(log::parse_level("trace"), log::Level::Trace);
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("warn"), log::Level::Warn);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_EQ(log::parse_level("info"), log::Level::Info);
  EXPECT_EQ(log::parse_level("verbose"), log::Level::Info);
}
