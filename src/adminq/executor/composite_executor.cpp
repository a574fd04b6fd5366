#include "adminq/executor/composite_executor.hpp"

#include "adminq/config/system_config.hpp"
#include "adminq/executor/docker_executor.hpp"
#include "adminq/executor/ollama_executor.hpp"
#include "adminq/storage/state_strings.hpp"
#include "adminq/util/log.hpp"

#include <format>

namespace adminq {

auto CompositeExecutor::register_executor(std::unique_ptr<IExecutor> executor)
    -> void {
  executors_.push_back(std::move(executor));
}

auto CompositeExecutor::route(TaskKind kind) const -> IExecutor* {
  for (const auto& executor : executors_) {
    if (executor->supports(kind)) {
      return executor.get();
    }
  }
  return nullptr;
}

auto CompositeExecutor::supports(TaskKind kind) const -> bool {
  return route(kind) != nullptr;
}

auto CompositeExecutor::validate(TaskKind kind,
                                 const nlohmann::json& params) const
    -> Validation {
  auto* executor = route(kind);
  if (executor == nullptr) {
    return std::unexpected(
        std::format("no executor registered for {}", task_kind_name(kind)));
  }
  return executor->validate(kind, params);
}

auto CompositeExecutor::derive_key(TaskKind kind,
                                   const nlohmann::json& params) const
    -> std::string {
  auto* executor = route(kind);
  return executor != nullptr ? executor->derive_key(kind, params)
                             : std::string{};
}

auto CompositeExecutor::start(ExecutorRequest req, ExecutionSink sink)
    -> void {
  auto* executor = route(req.kind);
  if (executor == nullptr) {
    log::error("CompositeExecutor: no executor registered for kind {}",
               task_kind_name(req.kind));
    if (sink.on_complete) {
      sink.on_complete(req.attempt_id,
                       ExecutionOutcome::fatal(
                           "No executor available for requested kind"));
    }
    return;
  }

  AttemptId attempt_id = req.attempt_id;
  {
    std::lock_guard lock(mutex_);
    attempt_executor_map_[attempt_id] = executor;
  }

  // Drop the routing entry once the attempt completes
  auto original_on_complete = std::move(sink.on_complete);
  sink.on_complete = [this, attempt_id,
                      on_complete = std::move(original_on_complete)](
                         const AttemptId& id, ExecutionOutcome outcome) mutable {
    {
      std::lock_guard lock(mutex_);
      attempt_executor_map_.erase(attempt_id);
    }
    if (on_complete) {
      on_complete(id, std::move(outcome));
    }
  };

  executor->start(std::move(req), std::move(sink));
}

auto CompositeExecutor::cancel(const AttemptId& attempt_id) -> void {
  IExecutor* executor = nullptr;
  {
    std::lock_guard lock(mutex_);
    auto it = attempt_executor_map_.find(attempt_id);
    if (it == attempt_executor_map_.end()) {
      log::debug("CompositeExecutor: no executor mapping for attempt {}",
                 attempt_id);
      return;
    }
    executor = it->second;
  }
  executor->cancel(attempt_id);
}

auto create_composite_executor(const ExecutorsConfig& config)
    -> std::unique_ptr<IExecutor> {
  auto composite = std::make_unique<CompositeExecutor>();
  if (config.dry_run) {
    composite->register_executor(create_noop_executor());
    return composite;
  }
  composite->register_executor(create_docker_executor(config));
  composite->register_executor(create_ollama_executor(config));
  return composite;
}

}  // namespace adminq
