#include "adminq/queue/worker_pool.hpp"

#include "adminq/storage/state_strings.hpp"
#include "adminq/util/log.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <optional>

namespace adminq {

namespace {

// Releases the key on every exit path of an attempt.
class KeyGuard {
public:
  KeyGuard(PendingQueue& pending, std::string key)
      : pending_(pending), key_(std::move(key)) {}
  ~KeyGuard() { pending_.release(key_); }

  KeyGuard(const KeyGuard&) = delete;
  auto operator=(const KeyGuard&) -> KeyGuard& = delete;

private:
  PendingQueue& pending_;
  std::string key_;
};

// Shared with the executor's callbacks. Once `open` is false the attempt is
// abandoned and late callbacks are dropped.
struct AttemptState {
  std::mutex mu;
  std::condition_variable cv;
  std::optional<ExecutionOutcome> outcome;
  bool open{true};
};

enum class Interrupt : std::uint8_t {
  None,
  TimedOut,
  Cancelled,
  Shutdown,
};

auto seconds_of(std::chrono::milliseconds ms) -> double {
  return static_cast<double>(ms.count()) / 1000.0;
}

}  // namespace

WorkerPool::WorkerPool(TaskStore& store, PendingQueue& pending,
                       IExecutor& executor, WorkerPoolOptions options)
    : store_(store), pending_(pending), executor_(executor),
      options_(std::move(options)) {
  options_.concurrency = std::max(1, options_.concurrency);
  if (options_.cancel_poll.count() <= 0) {
    options_.cancel_poll = timing::kCancelPollInterval;
  }
}

WorkerPool::~WorkerPool() {
  stop();
}

auto WorkerPool::start() -> void {
  if (running()) {
    return;
  }
  workers_.reserve(static_cast<std::size_t>(options_.concurrency));
  for (int i = 0; i < options_.concurrency; ++i) {
    workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
  }
  log::info("Worker pool started with {} workers", options_.concurrency);
}

auto WorkerPool::stop() -> void {
  if (!running()) {
    return;
  }
  pending_.stop();
  for (auto& w : workers_) {
    w.request_stop();
  }
  workers_.clear();
  log::info("Worker pool stopped");
}

auto WorkerPool::worker_loop(std::stop_token st) -> void {
  while (!st.stop_requested()) {
    auto ticket = pending_.acquire();
    if (!ticket) {
      break;
    }
    busy_.fetch_add(1, std::memory_order_relaxed);
    run_attempt(*ticket, st);
    busy_.fetch_sub(1, std::memory_order_relaxed);
  }
}

auto WorkerPool::run_attempt(const PendingQueue::Ticket& ticket,
                             std::stop_token st) -> void {
  KeyGuard guard(pending_, ticket.key);
  const auto& id = ticket.id;

  auto begun = store_.update(id, [](Task& t) -> Result<void> {
    if (auto r = t.transition_to(TaskState::Running); !r) {
      return r;
    }
    ++t.attempt_count;
    t.started_at = std::chrono::system_clock::now();
    t.finished_at.reset();
    t.result.reset();
    t.progress = 0;
    t.current_step = "starting";
    t.add_log(std::format("Attempt {} started", t.attempt_count));
    return ok();
  });
  if (!begun) {
    // Cancelled or evicted while queued.
    log::debug("Skipping task {}: {}", id, begun.error().message());
    return;
  }

  const int attempt = begun->attempt_count;
  const auto attempt_id = make_attempt_id(id, attempt);
  log::info("Task {} ({}) attempt {} started on key '{}'", id,
            task_kind_name(begun->kind), attempt, ticket.key);

  auto state = std::make_shared<AttemptState>();
  CancellationSource source;
  auto deadline = std::chrono::steady_clock::now() + options_.attempt_timeout;

  std::optional<ExecutionOutcome> outcome;
  Interrupt interrupt = Interrupt::None;

  if (begun->cancel_requested) {
    interrupt = Interrupt::Cancelled;
  } else {
    ExecutionSink sink;
    sink.on_progress = [this, state, id](const AttemptId&, int percent,
                                         std::string_view step) {
      std::lock_guard lock(state->mu);
      if (!state->open) {
        return;
      }
      (void)store_.update(
          id,
          [&](Task& t) -> Result<void> {
            if (t.state != TaskState::Running) {
              return fail(Error::InvalidTransition);
            }
            t.progress = std::clamp(percent, 0, 100);
            t.current_step = std::string(step);
            return ok();
          },
          WriteMode::Deferred);
    };
    sink.on_log = [this, state, id](const AttemptId&, std::string_view line) {
      std::lock_guard lock(state->mu);
      if (!state->open) {
        return;
      }
      store_.append_log(id, std::string(line));
    };
    sink.on_complete = [state](const AttemptId&, ExecutionOutcome result) {
      std::lock_guard lock(state->mu);
      if (!state->outcome) {
        state->outcome = std::move(result);
      }
      state->cv.notify_all();
    };

    ExecutorRequest req{
        .attempt_id = attempt_id,
        .kind = begun->kind,
        .key = ticket.key,
        .params = begun->params,
        .deadline = deadline,
        .cancel = source.token(),
    };

    try {
      executor_.start(std::move(req), std::move(sink));
    } catch (const std::exception& e) {
      log::error("Executor failed to start task {}: {}", id, e.what());
      std::lock_guard lock(state->mu);
      if (!state->outcome) {
        state->outcome = ExecutionOutcome::fatal(
            std::format("executor failed to start: {}", e.what()));
      }
    }

    std::unique_lock lock(state->mu);
    while (!state->outcome) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        interrupt = Interrupt::TimedOut;
        break;
      }
      if (st.stop_requested()) {
        interrupt = Interrupt::Shutdown;
        break;
      }
      if (store_.cancel_requested(id)) {
        interrupt = Interrupt::Cancelled;
        break;
      }
      state->cv.wait_until(lock, std::min(now + options_.cancel_poll, deadline));
    }
    state->open = false;
    outcome = state->outcome;
    lock.unlock();

    if (!outcome) {
      source.cancel();
      executor_.cancel(attempt_id);
    }
  }

  const auto& retry = options_.retry;
  bool requeue = false;
  std::chrono::milliseconds delay{0};

  auto finished = store_.update(id, [&](Task& t) -> Result<void> {
    if (t.state != TaskState::Running) {
      return fail(Error::InvalidTransition);
    }
    auto now = std::chrono::system_clock::now();
    requeue = false;

    if (interrupt == Interrupt::Shutdown) {
      if (retry.exhausted(t.attempt_count)) {
        if (auto r = t.transition_to(TaskState::Failed); !r) {
          return r;
        }
        t.finished_at = now;
        t.current_step = "failed";
        t.result = interrupted_failure(t.attempt_count);
        t.add_log(std::format("Attempt {} interrupted by shutdown; no attempts left",
                              t.attempt_count));
        return ok();
      }
      if (auto r = t.transition_to(TaskState::Pending); !r) {
        return r;
      }
      t.progress = 0;
      t.current_step = "queued";
      t.add_log("Interrupted by shutdown, will resume on restart");
      return ok();
    }

    // A cancel request wins over whatever the attempt produced.
    if (t.cancel_requested || interrupt == Interrupt::Cancelled) {
      if (auto r = t.transition_to(TaskState::Cancelled); !r) {
        return r;
      }
      t.finished_at = now;
      t.current_step = "cancelled";
      t.add_log("Task cancelled");
      return ok();
    }

    ExecutionOutcome result = interrupt == Interrupt::TimedOut
                                  ? ExecutionOutcome::retryable(std::format(
                                        "attempt timed out after {}s",
                                        seconds_of(options_.attempt_timeout)))
                                  : *outcome;

    switch (result.kind) {
      case ExecutionOutcome::Kind::Success:
        if (auto r = t.transition_to(TaskState::Succeeded); !r) {
          return r;
        }
        t.result = std::move(result.result);
        t.progress = 100;
        t.current_step = "completed";
        t.finished_at = now;
        t.add_log("Task completed successfully");
        return ok();

      case ExecutionOutcome::Kind::Retryable:
        if (!retry.exhausted(t.attempt_count)) {
          delay = retry.backoff(t.attempt_count);
          if (auto r = t.transition_to(TaskState::Pending); !r) {
            return r;
          }
          t.progress = 0;
          t.current_step = "waiting to retry";
          t.add_log(std::format("Attempt {} failed: {}; retrying in {} ms",
                                t.attempt_count, result.reason, delay.count()));
          requeue = true;
          return ok();
        }
        if (auto r = t.transition_to(TaskState::Failed); !r) {
          return r;
        }
        t.finished_at = now;
        t.current_step = "failed";
        t.result = nlohmann::json{{"error", result.reason},
                                  {"retryable", true},
                                  {"attempts", t.attempt_count}};
        t.add_log(std::format("Attempt {} failed: {}; giving up after {} attempts",
                              t.attempt_count, result.reason, t.attempt_count));
        return ok();

      case ExecutionOutcome::Kind::Fatal:
        if (auto r = t.transition_to(TaskState::Failed); !r) {
          return r;
        }
        t.finished_at = now;
        t.current_step = "failed";
        t.result = nlohmann::json{{"error", result.reason},
                                  {"retryable", false},
                                  {"attempts", t.attempt_count}};
        t.add_log(std::format("Attempt {} failed: {}", t.attempt_count,
                              result.reason));
        return ok();
    }
    return fail(Error::Unknown);
  });

  if (!finished) {
    log::warn("Could not record outcome of task {}: {}", id,
              finished.error().message());
    return;
  }

  switch (finished->state) {
    case TaskState::Succeeded:
      log::info("Task {} succeeded after {} attempt(s)", id, attempt);
      break;
    case TaskState::Failed:
      log::warn("Task {} failed: {}", id,
                finished->result ? finished->result->value("error", "") : "");
      break;
    case TaskState::Cancelled:
      log::info("Task {} cancelled", id);
      break;
    case TaskState::Pending:
      if (requeue) {
        log::info("Task {} will retry in {} ms", id, delay.count());
        // Queued before the key is released so no later arrival on the same
        // key can overtake it.
        auto ready_at = std::chrono::steady_clock::now() + delay;
        if (options_.requeue) {
          options_.requeue(id, ticket.key, ready_at);
        } else {
          pending_.push(id, ticket.key, ready_at);
        }
      } else {
        log::info("Task {} interrupted by shutdown", id);
      }
      break;
    case TaskState::Running:
      break;
  }
}

}  // namespace adminq
