#pragma once

#include "adminq/core/constants.hpp"
#include "adminq/executor/executor.hpp"
#include "adminq/queue/pending_queue.hpp"
#include "adminq/queue/retry_policy.hpp"
#include "adminq/queue/task_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <stop_token>
#include <thread>
#include <vector>

namespace adminq {

struct WorkerPoolOptions {
  int concurrency{2};
  RetryPolicy retry;
  std::chrono::milliseconds attempt_timeout{std::chrono::minutes(30)};
  std::chrono::milliseconds cancel_poll{timing::kCancelPollInterval};
  // Puts a retry back at the tail of its key bucket. When unset the ticket
  // is pushed straight onto the pending queue.
  std::function<void(const TaskId&, const std::string& key,
                     std::chrono::steady_clock::time_point ready_at)>
      requeue;
};

// Fixed set of worker threads. Each takes an eligible ticket from the
// pending queue, runs one attempt with a deadline and records the result.
// The key stays locked for the whole attempt.
class WorkerPool {
public:
  WorkerPool(TaskStore& store, PendingQueue& pending, IExecutor& executor,
             WorkerPoolOptions options);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  auto operator=(const WorkerPool&) -> WorkerPool& = delete;

  auto start() -> void;
  // Running attempts are abandoned. Their tasks go back to Pending, or to
  // Failed when no attempts are left.
  auto stop() -> void;

  [[nodiscard]] auto running() const noexcept -> bool {
    return !workers_.empty();
  }
  [[nodiscard]] auto busy() const noexcept -> int {
    return busy_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto options() const noexcept -> const WorkerPoolOptions& {
    return options_;
  }

private:
  auto worker_loop(std::stop_token st) -> void;
  auto run_attempt(const PendingQueue::Ticket& ticket, std::stop_token st)
      -> void;

  TaskStore& store_;
  PendingQueue& pending_;
  IExecutor& executor_;
  WorkerPoolOptions options_;

  std::vector<std::jthread> workers_;
  std::atomic<int> busy_{0};
};

}  // namespace adminq
