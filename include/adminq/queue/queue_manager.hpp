#pragma once

#include "adminq/config/system_config.hpp"
#include "adminq/core/error.hpp"
#include "adminq/executor/executor.hpp"
#include "adminq/queue/pending_queue.hpp"
#include "adminq/queue/retry_policy.hpp"
#include "adminq/queue/task.hpp"
#include "adminq/queue/task_store.hpp"
#include "adminq/queue/worker_pool.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace adminq {

struct QueueOptions {
  int concurrency{2};
  RetryPolicy retry;
  std::chrono::milliseconds attempt_timeout{std::chrono::minutes(30)};
  std::chrono::milliseconds cancel_poll{timing::kCancelPollInterval};
  std::chrono::seconds retention{std::chrono::hours(24)};
  std::size_t max_retained{10000};

  [[nodiscard]] static auto from_config(const QueueConfig& cfg) -> QueueOptions;
};

enum class CancelDisposition : std::uint8_t {
  Cancelled,
  CancellationRequested,
  AlreadyTerminal,
};

struct CancelOutcome {
  CancelDisposition disposition{CancelDisposition::AlreadyTerminal};
  TaskState state{TaskState::Pending};

  [[nodiscard]] auto accepted() const noexcept -> bool {
    return disposition != CancelDisposition::AlreadyTerminal;
  }
};

struct QueueStats {
  StateCounts counts;
  std::size_t running{0};
  int concurrency{0};
  bool paused{false};
  std::size_t pending{0};
};

[[nodiscard]] auto cancel_disposition_name(CancelDisposition d) noexcept
    -> std::string_view;

// Public face of the task queue: admission, queries, cancellation and the
// lifecycle of the worker pool. Tasks sharing a key run one at a time in
// submission order; different keys run in parallel up to the concurrency
// limit.
class QueueManager {
public:
  QueueManager(IExecutor& executor, TaskStore& store, QueueOptions options);
  ~QueueManager();

  QueueManager(const QueueManager&) = delete;
  auto operator=(const QueueManager&) -> QueueManager& = delete;

  // Empty key means "derive from params".
  [[nodiscard]] auto submit(TaskKind kind, std::string key,
                            nlohmann::json params) -> Result<TaskId>;
  [[nodiscard]] auto submit(std::string_view kind, std::string key,
                            nlohmann::json params) -> Result<TaskId>;

  // Reason a submission with these arguments is rejected, empty if it would
  // be admitted.
  [[nodiscard]] auto explain_rejection(std::string_view kind,
                                       const nlohmann::json& params) const
      -> std::string;

  [[nodiscard]] auto status(const TaskId& id) const -> Result<TaskSnapshot>;
  [[nodiscard]] auto list_status(const TaskFilter& filter = {}) const
      -> std::vector<TaskSnapshot>;
  [[nodiscard]] auto task_logs(const TaskId& id) const
      -> Result<std::vector<TaskLogEntry>>;

  [[nodiscard]] auto cancel(const TaskId& id) -> Result<CancelOutcome>;

  [[nodiscard]] auto stats() const -> QueueStats;
  auto clear_completed() -> std::size_t;
  auto evict_expired() -> std::size_t;

  auto pause() -> void;
  auto resume() -> void;
  [[nodiscard]] auto paused() const -> bool;

  // Adopts recovered tasks and queues the Pending ones in submission order.
  // Call before start().
  auto restore(std::vector<Task> tasks) -> void;

  auto start() -> void;
  // Rejects new submissions and stops the workers. Running tasks go back to
  // Pending and resume after the next restore(), unless their last allowed
  // attempt was the one interrupted.
  auto stop() -> void;

  [[nodiscard]] auto running() const noexcept -> bool {
    return pool_.running();
  }
  [[nodiscard]] auto options() const noexcept -> const QueueOptions& {
    return options_;
  }

private:
  auto maybe_evict() -> void;
  auto requeue_retry(const TaskId& id, const std::string& key,
                     std::chrono::steady_clock::time_point ready_at) -> void;

  IExecutor& executor_;
  TaskStore& store_;
  QueueOptions options_;

  PendingQueue pending_;
  WorkerPool pool_;

  std::mutex submit_mu_;
  std::uint64_t next_sequence_{1};
  std::atomic<bool> stopping_{false};
  std::atomic<std::int64_t> last_evict_ms_{0};
};

}  // namespace adminq
