#include "adminq/queue/pending_queue.hpp"

#include "test_utils.hpp"

#include <future>
#include <thread>

#include "gtest/gtest.h"

using namespace adminq;
using namespace adminq::test;

TEST(PendingQueueTest, Acquire_SameKey_IsFifo) {
  PendingQueue q;
  q.push(task_id("a"), "k");
  q.push(task_id("b"), "k");

  auto first = q.acquire();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->id, task_id("a"));
  q.release("k");

  auto second = q.acquire();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->id, task_id("b"));
}

TEST(PendingQueueTest, Acquire_LocksKey_UntilRelease) {
  PendingQueue q;
  q.push(task_id("a"), "k");
  q.push(task_id("b"), "k");

  auto first = q.acquire();
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(q.is_locked("k"));

  auto pending = std::async(std::launch::async, [&] { return q.acquire(); });
  EXPECT_EQ(pending.wait_for(50ms), std::future_status::timeout);

  q.release("k");
  ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
  auto second = pending.get();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->id, task_id("b"));
}

TEST(PendingQueueTest, Acquire_OtherKeyNotBlockedByLockedKey) {
  PendingQueue q;
  q.push(task_id("a1"), "a");
  q.push(task_id("a2"), "a");
  q.push(task_id("b1"), "b");

  auto first = q.acquire();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->id, task_id("a1"));

  // a2 is older than b1 but its key is locked.
  auto second = q.acquire();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->id, task_id("b1"));
  EXPECT_EQ(q.locked_count(), 2u);
}

TEST(PendingQueueTest, Acquire_PicksOldestEligibleAcrossKeys) {
  PendingQueue q;
  q.push(task_id("x"), "kx");
  q.push(task_id("y"), "ky");
  q.push(task_id("z"), "kz");

  EXPECT_EQ(q.acquire()->id, task_id("x"));
  EXPECT_EQ(q.acquire()->id, task_id("y"));
  EXPECT_EQ(q.acquire()->id, task_id("z"));
}

TEST(PendingQueueTest, Acquire_WaitsForReadyAt) {
  PendingQueue q;
  auto start = PendingQueue::Clock::now();
  q.push(task_id("late"), "k", start + 80ms);

  auto ticket = q.acquire();
  ASSERT_TRUE(ticket.has_value());
  EXPECT_GE(PendingQueue::Clock::now() - start, 80ms);
}

TEST(PendingQueueTest, DelayedHead_HoldsBackItsBucketOnly) {
  PendingQueue q;
  auto now = PendingQueue::Clock::now();
  q.push(task_id("retry"), "k", now + 10s);
  q.push(task_id("next"), "k");
  q.push(task_id("other"), "o");

  auto ticket = q.acquire();
  ASSERT_TRUE(ticket.has_value());
  EXPECT_EQ(ticket->id, task_id("other"));
  EXPECT_TRUE(q.contains(task_id("retry")));
  EXPECT_TRUE(q.contains(task_id("next")));
}

TEST(PendingQueueTest, Pause_BlocksSelection_ResumeWakes) {
  PendingQueue q;
  q.pause();
  q.push(task_id("a"), "k");

  auto pending = std::async(std::launch::async, [&] { return q.acquire(); });
  EXPECT_EQ(pending.wait_for(50ms), std::future_status::timeout);
  EXPECT_TRUE(q.paused());

  q.resume();
  ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(pending.get()->id, task_id("a"));
}

TEST(PendingQueueTest, Stop_WakesBlockedAcquire) {
  PendingQueue q;
  auto pending = std::async(std::launch::async, [&] { return q.acquire(); });
  EXPECT_EQ(pending.wait_for(20ms), std::future_status::timeout);

  q.stop();
  ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
  EXPECT_FALSE(pending.get().has_value());
  EXPECT_TRUE(q.stopped());
}

TEST(PendingQueueTest, Remove_DropsQueuedEntry) {
  PendingQueue q;
  q.push(task_id("a"), "k");
  q.push(task_id("b"), "k");

  EXPECT_TRUE(q.remove(task_id("a")));
  EXPECT_FALSE(q.remove(task_id("a")));
  EXPECT_EQ(q.size(), 1u);
  EXPECT_EQ(q.acquire()->id, task_id("b"));
}

TEST(PendingQueueTest, Remove_AfterAcquire_ReturnsFalse) {
  PendingQueue q;
  q.push(task_id("a"), "k");
  auto ticket = q.acquire();
  ASSERT_TRUE(ticket.has_value());

  EXPECT_FALSE(q.remove(task_id("a")));
}

TEST(PendingQueueTest, RepositoryKey_WaitsForTagKeysOfThatRepository) {
  PendingQueue q;
  q.push(task_id("v1"), "web:v1");
  q.push(task_id("all"), "web:*");
  q.push(task_id("other"), "webapp:v1");

  EXPECT_EQ(q.acquire()->id, task_id("v1"));
  EXPECT_TRUE(q.is_blocked("web:*"));

  // webapp is a different repository.
  EXPECT_EQ(q.acquire()->id, task_id("other"));

  auto pending = std::async(std::launch::async, [&] { return q.acquire(); });
  EXPECT_EQ(pending.wait_for(50ms), std::future_status::timeout);

  q.release("web:v1");
  ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(pending.get()->id, task_id("all"));
}

TEST(PendingQueueTest, RepositoryKey_BlocksTagKeysWhileHeld) {
  PendingQueue q;
  q.push(task_id("all"), "registry:5000/web:*");
  q.push(task_id("v2"), "registry:5000/web:v2");
  q.push(task_id("base"), "base:latest");

  EXPECT_EQ(q.acquire()->id, task_id("all"));
  EXPECT_TRUE(q.is_blocked("registry:5000/web:v2"));
  EXPECT_FALSE(q.is_blocked("base:latest"));
  EXPECT_EQ(q.acquire()->id, task_id("base"));

  q.release("registry:5000/web:*");
  EXPECT_FALSE(q.is_blocked("registry:5000/web:v2"));
  EXPECT_EQ(q.acquire()->id, task_id("v2"));
}
