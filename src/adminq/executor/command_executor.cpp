#include "adminq/executor/command_executor.hpp"

#include "adminq/storage/state_strings.hpp"
#include "adminq/util/log.hpp"

#include <exception>
#include <format>

namespace adminq {

CommandExecutor::~CommandExecutor() {
  shutdown();
}

auto CommandExecutor::start_step(const ExecutorRequest& req) const
    -> std::string {
  return std::format("running {}", task_kind_name(req.kind));
}

auto CommandExecutor::start(ExecutorRequest req, ExecutionSink sink) -> void {
  reap_finished();

  if (shutting_down_.load(std::memory_order_acquire)) {
    if (sink.on_complete) {
      sink.on_complete(req.attempt_id,
                       ExecutionOutcome::retryable("executor shutting down"));
    }
    return;
  }

  AttemptId id = req.attempt_id;
  std::lock_guard lock(mutex_);
  threads_.insert_or_assign(
      id, std::jthread([this, req = std::move(req),
                        sink = std::move(sink)]() mutable {
        run_attempt(std::move(req), std::move(sink));
      }));
}

auto CommandExecutor::run_attempt(ExecutorRequest req, ExecutionSink sink)
    -> void {
  const AttemptId id = req.attempt_id;
  ExecutionOutcome outcome;

  try {
    auto spec = build_command(req);
    if (!spec) {
      outcome = ExecutionOutcome::fatal(spec.error());
    } else {
      if (sink.on_progress) {
        sink.on_progress(id, 10, start_step(req));
      }
      if (sink.on_log) {
        sink.on_log(id, std::format("$ {}", format_command(spec->argv)));
      }

      ProcessHooks hooks{
          .should_stop =
              [&] {
                if (shutting_down_.load(std::memory_order_acquire) ||
                    req.cancel.is_cancelled()) {
                  return true;
                }
                std::lock_guard lock(mutex_);
                return cancelled_.contains(id);
              },
          .on_line =
              [&](std::string_view line) {
                if (sink.on_log) {
                  sink.on_log(id, line);
                }
              },
          .on_spawn =
              [&](pid_t pid) {
                std::lock_guard lock(mutex_);
                active_pids_[id] = pid;
                if (cancelled_.contains(id)) {
                  kill_process_group(pid);
                }
              },
      };

      auto result = run_process(*spec, req.deadline, hooks);
      {
        // A kill from cancel() can close the output before the runner
        // notices the stop request.
        std::lock_guard lock(mutex_);
        active_pids_.erase(id);
        result.cancelled = result.cancelled || cancelled_.contains(id) ||
                           req.cancel.is_cancelled();
      }

      if (!result.error.empty()) {
        outcome = ExecutionOutcome::retryable(result.error);
      } else if (result.cancelled) {
        outcome = ExecutionOutcome::fatal("cancelled");
      } else if (result.timed_out) {
        outcome = ExecutionOutcome::retryable("timed out");
      } else {
        outcome = interpret(req, result);
      }
    }
  } catch (const std::exception& e) {
    log::error("Attempt {} raised: {}", id, e.what());
    outcome = ExecutionOutcome::fatal(std::format("executor error: {}", e.what()));
  }

  if (sink.on_complete) {
    sink.on_complete(id, std::move(outcome));
  }

  std::lock_guard lock(mutex_);
  cancelled_.erase(id);
  finished_.push_back(id);
}

auto CommandExecutor::cancel(const AttemptId& attempt_id) -> void {
  std::lock_guard lock(mutex_);
  if (!threads_.contains(attempt_id)) {
    return;
  }
  cancelled_.insert(attempt_id);
  if (auto it = active_pids_.find(attempt_id); it != active_pids_.end()) {
    kill_process_group(it->second);
    log::info("Cancelled process for attempt {}", attempt_id);
  }
}

auto CommandExecutor::active_attempts() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return threads_.size() > finished_.size() ? threads_.size() - finished_.size()
                                            : 0;
}

auto CommandExecutor::reap_finished() -> void {
  std::vector<std::jthread> done;
  {
    std::lock_guard lock(mutex_);
    for (const auto& id : finished_) {
      if (auto it = threads_.find(id); it != threads_.end()) {
        done.push_back(std::move(it->second));
        threads_.erase(it);
      }
      cancelled_.erase(id);
    }
    finished_.clear();
  }
  // jthread joins on destruction; the attempt already returned
}

auto CommandExecutor::shutdown() -> void {
  shutting_down_.store(true, std::memory_order_release);

  std::vector<std::jthread> remaining;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, pid] : active_pids_) {
      kill_process_group(pid);
    }
    for (auto& [id, thread] : threads_) {
      thread.request_stop();
      remaining.push_back(std::move(thread));
    }
    threads_.clear();
    finished_.clear();
  }
}

}  // namespace adminq
