#pragma once

#include "adminq/config/system_config.hpp"
#include "adminq/executor/command_executor.hpp"

#include <memory>
#include <string>

namespace adminq {

// ollama_pull runs `ollama pull`; ollama_run posts to the server's
// /api/generate endpoint through curl.
class OllamaExecutor : public CommandExecutor {
public:
  explicit OllamaExecutor(ExecutorsConfig config);
  ~OllamaExecutor() override;

  [[nodiscard]] auto supports(TaskKind kind) const -> bool override;
  [[nodiscard]] auto validate(TaskKind kind, const nlohmann::json& params) const
      -> Validation override;
  [[nodiscard]] auto derive_key(TaskKind kind,
                                const nlohmann::json& params) const
      -> std::string override;

  [[nodiscard]] auto build_command(const ExecutorRequest& req) const
      -> std::expected<ProcessSpec, std::string> override;
  [[nodiscard]] auto interpret(const ExecutorRequest& req,
                               const ProcessResult& result) const
      -> ExecutionOutcome override;

protected:
  [[nodiscard]] auto start_step(const ExecutorRequest& req) const
      -> std::string override;

private:
  ExecutorsConfig config_;
};

[[nodiscard]] auto create_ollama_executor(const ExecutorsConfig& config)
    -> std::unique_ptr<IExecutor>;

}  // namespace adminq
