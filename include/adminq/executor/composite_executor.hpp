#pragma once

#include "adminq/executor/executor.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace adminq {

struct ExecutorsConfig;

// Routes each task kind to the first registered executor that supports it.
class CompositeExecutor : public IExecutor {
public:
  CompositeExecutor() = default;
  ~CompositeExecutor() override = default;

  CompositeExecutor(const CompositeExecutor&) = delete;
  auto operator=(const CompositeExecutor&) -> CompositeExecutor& = delete;

  auto register_executor(std::unique_ptr<IExecutor> executor) -> void;

  [[nodiscard]] auto supports(TaskKind kind) const -> bool override;
  [[nodiscard]] auto validate(TaskKind kind, const nlohmann::json& params) const
      -> Validation override;
  [[nodiscard]] auto derive_key(TaskKind kind,
                                const nlohmann::json& params) const
      -> std::string override;

  auto start(ExecutorRequest req, ExecutionSink sink) -> void override;

  auto cancel(const AttemptId& attempt_id) -> void override;

private:
  [[nodiscard]] auto route(TaskKind kind) const -> IExecutor*;

  std::vector<std::unique_ptr<IExecutor>> executors_;
  std::unordered_map<AttemptId, IExecutor*> attempt_executor_map_;
  std::mutex mutex_;
};

[[nodiscard]] auto create_composite_executor(const ExecutorsConfig& config)
    -> std::unique_ptr<IExecutor>;

}  // namespace adminq
