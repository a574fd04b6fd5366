#pragma once

#include "adminq/config/system_config.hpp"
#include "adminq/executor/command_executor.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace adminq {

// docker push/build/pull/tag through the docker CLI.
class DockerExecutor : public CommandExecutor {
public:
  explicit DockerExecutor(ExecutorsConfig config);
  ~DockerExecutor() override;

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

// name:tag, with tag defaulting to "latest".
[[nodiscard]] auto docker_image_ref(const nlohmann::json& params)
    -> std::string;

[[nodiscard]] auto parse_push_digest(std::string_view output)
    -> std::optional<std::string>;

// Authentication, missing repository and malformed reference errors never
// succeed on retry; everything else is treated as transient.
[[nodiscard]] auto is_fatal_docker_error(std::string_view output) -> bool;

[[nodiscard]] auto create_docker_executor(const ExecutorsConfig& config)
    -> std::unique_ptr<IExecutor>;

}  // namespace adminq
