#pragma once

#include "adminq/executor/executor.hpp"
#include "adminq/executor/process_runner.hpp"

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace adminq {

// Base for executors that drive an external CLI. Each attempt runs on its
// own thread; cancel() kills the attempt's process group.
class CommandExecutor : public IExecutor {
public:
  CommandExecutor() = default;
  ~CommandExecutor() override;

  CommandExecutor(const CommandExecutor&) = delete;
  auto operator=(const CommandExecutor&) -> CommandExecutor& = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> void override;
  auto cancel(const AttemptId& attempt_id) -> void override;

  [[nodiscard]] auto active_attempts() const -> std::size_t;

protected:
  // Must call shutdown() from the most-derived destructor so no attempt
  // thread outlives the overrides it calls.
  auto shutdown() -> void;

  [[nodiscard]] virtual auto build_command(const ExecutorRequest& req) const
      -> std::expected<ProcessSpec, std::string> = 0;

  [[nodiscard]] virtual auto interpret(const ExecutorRequest& req,
                                       const ProcessResult& result) const
      -> ExecutionOutcome = 0;

  // Progress reported when the command starts, and the label for it.
  [[nodiscard]] virtual auto start_step(const ExecutorRequest& req) const
      -> std::string;

private:
  auto run_attempt(ExecutorRequest req, ExecutionSink sink) -> void;
  auto reap_finished() -> void;

  mutable std::mutex mutex_;
  std::unordered_map<AttemptId, pid_t> active_pids_;
  std::unordered_set<AttemptId> cancelled_;
  std::unordered_map<AttemptId, std::jthread> threads_;
  std::vector<AttemptId> finished_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace adminq
