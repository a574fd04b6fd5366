#include "adminq/queue/queue_manager.hpp"

#include "adminq/core/constants.hpp"
#include "adminq/storage/state_strings.hpp"
#include "adminq/util/log.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace adminq {

namespace {

auto steady_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace

auto QueueOptions::from_config(const QueueConfig& cfg) -> QueueOptions {
  QueueOptions opts;
  opts.concurrency = cfg.concurrency;
  opts.retry.max_attempts = cfg.max_attempts;
  opts.retry.base_delay = std::chrono::milliseconds(cfg.base_backoff_ms);
  opts.retry.max_delay = std::chrono::milliseconds(cfg.max_backoff_ms);
  opts.attempt_timeout = std::chrono::seconds(cfg.attempt_timeout_sec);
  opts.cancel_poll = std::chrono::milliseconds(cfg.cancel_poll_ms);
  opts.retention = std::chrono::seconds(cfg.retention_seconds);
  opts.max_retained = cfg.max_retained;
  return opts;
}

auto cancel_disposition_name(CancelDisposition d) noexcept -> std::string_view {
  switch (d) {
    case CancelDisposition::Cancelled:
      return "cancelled";
    case CancelDisposition::CancellationRequested:
      return "cancellation_requested";
    case CancelDisposition::AlreadyTerminal:
      return "already_terminal";
  }
  return "unknown";
}

QueueManager::QueueManager(IExecutor& executor, TaskStore& store,
                           QueueOptions options)
    : executor_(executor), store_(store), options_(std::move(options)),
      pool_(store_, pending_, executor_,
            WorkerPoolOptions{.concurrency = options_.concurrency,
                              .retry = options_.retry,
                              .attempt_timeout = options_.attempt_timeout,
                              .cancel_poll = options_.cancel_poll,
                              .requeue = [this](const TaskId& id,
                                                const std::string& key,
                                                auto ready_at) {
                                requeue_retry(id, key, ready_at);
                              }}) {
}

QueueManager::~QueueManager() {
  stop();
}

auto QueueManager::submit(std::string_view kind, std::string key,
                          nlohmann::json params) -> Result<TaskId> {
  auto parsed = parse_task_kind(kind);
  if (!parsed) {
    log::warn("Rejected submission of unknown kind '{}'", kind);
    return fail(Error::ValidationError);
  }
  return submit(*parsed, std::move(key), std::move(params));
}

auto QueueManager::submit(TaskKind kind, std::string key,
                          nlohmann::json params) -> Result<TaskId> {
  if (stopping_.load(std::memory_order_acquire)) {
    return fail(Error::ShuttingDown);
  }
  if (params.is_null()) {
    params = nlohmann::json::object();
  }
  if (auto v = executor_.validate(kind, params); !v) {
    log::warn("Rejected {} submission: {}", task_kind_name(kind), v.error());
    return fail(Error::ValidationError);
  }
  if (key.empty()) {
    key = executor_.derive_key(kind, params);
  }

  Task task;
  task.id = generate_task_id();
  task.kind = kind;
  task.key = key;
  task.params = std::move(params);
  task.state = TaskState::Pending;
  task.current_step = "queued";
  auto id = task.id;

  {
    // Sequence order, creation time and bucket order must agree.
    std::lock_guard lock(submit_mu_);
    task.sequence = next_sequence_++;
    task.created_at = std::chrono::system_clock::now();
    task.add_log("Task added to queue", task.created_at);
    if (auto r = store_.insert(std::move(task)); !r) {
      return fail(r.error());
    }
    pending_.push(id, key);
  }

  log::info("Queued {} task {} on key '{}'", task_kind_name(kind), id, key);
  maybe_evict();
  return id;
}

auto QueueManager::explain_rejection(std::string_view kind,
                                     const nlohmann::json& params) const
    -> std::string {
  if (stopping_.load(std::memory_order_acquire)) {
    return "queue is shutting down";
  }
  auto parsed = parse_task_kind(kind);
  if (!parsed) {
    return std::format("unknown task kind '{}'", kind);
  }
  auto v = executor_.validate(
      *parsed, params.is_null() ? nlohmann::json::object() : params);
  return v ? std::string{} : v.error();
}

auto QueueManager::status(const TaskId& id) const -> Result<TaskSnapshot> {
  return store_.get(id);
}

auto QueueManager::list_status(const TaskFilter& filter) const
    -> std::vector<TaskSnapshot> {
  return store_.list(filter);
}

auto QueueManager::task_logs(const TaskId& id) const
    -> Result<std::vector<TaskLogEntry>> {
  auto snap = store_.get(id);
  if (!snap) {
    return fail(snap.error());
  }
  return std::move(snap->logs);
}

auto QueueManager::cancel(const TaskId& id) -> Result<CancelOutcome> {
  CancelOutcome outcome;

  auto updated = store_.update(id, [&](Task& t) -> Result<void> {
    switch (t.state) {
      case TaskState::Pending:
        if (auto r = t.transition_to(TaskState::Cancelled); !r) {
          return r;
        }
        t.cancel_requested = true;
        t.finished_at = std::chrono::system_clock::now();
        t.current_step = "cancelled";
        t.add_log("Task cancelled before it started");
        outcome.disposition = CancelDisposition::Cancelled;
        return ok();
      case TaskState::Running:
        if (!t.cancel_requested) {
          t.cancel_requested = true;
          t.add_log("Cancellation requested");
        }
        outcome.disposition = CancelDisposition::CancellationRequested;
        return ok();
      case TaskState::Succeeded:
      case TaskState::Failed:
      case TaskState::Cancelled:
        break;
    }
    return fail(Error::AlreadyTerminal);
  });

  if (!updated) {
    if (updated.error() != make_error_code(Error::AlreadyTerminal)) {
      return fail(updated.error());
    }
    auto snap = store_.get(id);
    if (!snap) {
      return fail(snap.error());
    }
    outcome.disposition = CancelDisposition::AlreadyTerminal;
    outcome.state = snap->state;
    return outcome;
  }

  outcome.state = updated->state;
  if (outcome.disposition == CancelDisposition::Cancelled) {
    pending_.remove(id);
    log::info("Task {} cancelled while pending", id);
  } else {
    log::info("Cancellation requested for running task {}", id);
  }
  return outcome;
}

auto QueueManager::stats() const -> QueueStats {
  QueueStats s;
  s.counts = store_.counts();
  s.running = s.counts[TaskState::Running];
  s.concurrency = options_.concurrency;
  s.paused = pending_.paused();
  s.pending = pending_.size();
  return s;
}

auto QueueManager::clear_completed() -> std::size_t {
  auto n = store_.clear_completed();
  log::info("Cleared {} finished tasks", n);
  return n;
}

auto QueueManager::evict_expired() -> std::size_t {
  last_evict_ms_.store(steady_ms(), std::memory_order_relaxed);
  return store_.evict_expired(options_.retention, options_.max_retained);
}

auto QueueManager::maybe_evict() -> void {
  auto now = steady_ms();
  auto last = last_evict_ms_.load(std::memory_order_relaxed);
  auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
                      timing::kEvictInterval)
                      .count();
  if (now - last < interval) {
    return;
  }
  if (last_evict_ms_.compare_exchange_strong(last, now,
                                             std::memory_order_relaxed)) {
    store_.evict_expired(options_.retention, options_.max_retained);
  }
}

// A retry takes a fresh sequence number so a restore rebuilds the bucket
// with it behind everything admitted before the retry.
auto QueueManager::requeue_retry(const TaskId& id, const std::string& key,
                                 std::chrono::steady_clock::time_point ready_at)
    -> void {
  std::lock_guard lock(submit_mu_);
  auto sequence = next_sequence_++;
  auto r = store_.update(id, [sequence](Task& t) -> Result<void> {
    t.sequence = sequence;
    return ok();
  });
  if (!r) {
    log::warn("Could not renumber retry of task {}: {}", id, r.error().message());
  }
  pending_.push(id, key, ready_at);
}

auto QueueManager::pause() -> void {
  pending_.pause();
  log::info("Queue paused");
}

auto QueueManager::resume() -> void {
  pending_.resume();
  log::info("Queue resumed");
}

auto QueueManager::paused() const -> bool {
  return pending_.paused();
}

auto QueueManager::restore(std::vector<Task> tasks) -> void {
  std::vector<std::pair<TaskId, std::string>> queued;
  // Buckets are rebuilt in admission order.
  std::ranges::sort(tasks, {}, &Task::sequence);
  for (const auto& t : tasks) {
    if (t.state == TaskState::Pending) {
      queued.emplace_back(t.id, t.key);
    }
  }

  store_.load(std::move(tasks));

  std::lock_guard lock(submit_mu_);
  next_sequence_ = std::max(next_sequence_, store_.max_sequence() + 1);
  for (auto& [id, key] : queued) {
    pending_.push(std::move(id), std::move(key));
  }
  if (!queued.empty()) {
    log::info("Restored {} pending tasks", queued.size());
  }
}

auto QueueManager::start() -> void {
  if (stopping_.load(std::memory_order_acquire)) {
    return;
  }
  pool_.start();
}

auto QueueManager::stop() -> void {
  stopping_.store(true, std::memory_order_release);
  pool_.stop();
}

}  // namespace adminq
