#include "adminq/executor/executor.hpp"
#include "adminq/storage/state_strings.hpp"

#include <format>

namespace adminq {

// Completes every attempt inline. Used for dry runs and benchmarks.
class NoopExecutor : public IExecutor {
public:
  NoopExecutor() = default;
  ~NoopExecutor() override = default;

  [[nodiscard]] auto supports(TaskKind) const -> bool override {
    return true;
  }

  [[nodiscard]] auto validate(TaskKind, const nlohmann::json& params) const
      -> Validation override {
    if (!params.is_object()) {
      return std::unexpected(std::string("params must be an object"));
    }
    return {};
  }

  [[nodiscard]] auto derive_key(TaskKind kind,
                                const nlohmann::json& params) const
      -> std::string override {
    if (auto it = params.find("image_name"); it != params.end() && it->is_string()) {
      return std::format("{}:{}", it->get<std::string>(),
                         params.value("tag", std::string{"latest"}));
    }
    if (auto it = params.find("model_name"); it != params.end() && it->is_string()) {
      return std::format("ollama:{}", it->get<std::string>());
    }
    return task_kind_name(kind);
  }

  auto start(ExecutorRequest req, ExecutionSink sink) -> void override {
    if (sink.on_complete) {
      sink.on_complete(req.attempt_id,
                       ExecutionOutcome::success(
                           {{"dry_run", true}, {"kind", task_kind_name(req.kind)}}));
    }
  }

  auto cancel(const AttemptId&) -> void override {
  }
};

auto create_noop_executor() -> std::unique_ptr<IExecutor> {
  return std::make_unique<NoopExecutor>();
}

}  // namespace adminq
