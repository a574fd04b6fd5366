#pragma once

#include "adminq/executor/cancellation.hpp"
#include "adminq/queue/task.hpp"
#include "adminq/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace adminq {

struct ExecutionOutcome {
  enum class Kind : std::uint8_t {
    Success,
    Retryable,
    Fatal,
  };

  Kind kind{Kind::Fatal};
  nlohmann::json result = nlohmann::json::object();
  std::string reason;

  [[nodiscard]] static auto success(nlohmann::json result = nlohmann::json::object())
      -> ExecutionOutcome {
    return {.kind = Kind::Success, .result = std::move(result), .reason = {}};
  }
  [[nodiscard]] static auto retryable(std::string reason) -> ExecutionOutcome {
    return {.kind = Kind::Retryable, .result = nlohmann::json::object(),
            .reason = std::move(reason)};
  }
  [[nodiscard]] static auto fatal(std::string reason) -> ExecutionOutcome {
    return {.kind = Kind::Fatal, .result = nlohmann::json::object(),
            .reason = std::move(reason)};
  }

  [[nodiscard]] auto ok() const noexcept -> bool {
    return kind == Kind::Success;
  }
};

struct ExecutorRequest {
  AttemptId attempt_id;
  TaskKind kind{TaskKind::DockerPush};
  std::string key;
  nlohmann::json params;
  std::chrono::steady_clock::time_point deadline{};
  CancellationToken cancel;
};

// Callbacks may fire from any thread. on_complete fires exactly once per
// started attempt; an abandoned attempt's late completion is dropped by the
// caller.
struct ExecutionSink {
  std::function<void(const AttemptId&, int percent, std::string_view step)>
      on_progress;
  std::function<void(const AttemptId&, std::string_view line)> on_log;
  std::move_only_function<void(const AttemptId&, ExecutionOutcome)> on_complete;
};

// Schema check result; the error carries a human-readable reason.
using Validation = std::expected<void, std::string>;

class IExecutor {
public:
  virtual ~IExecutor() = default;

  [[nodiscard]] virtual auto supports(TaskKind kind) const -> bool = 0;

  [[nodiscard]] virtual auto validate(TaskKind kind,
                                      const nlohmann::json& params) const
      -> Validation = 0;

  // Contention key when the submitter gives none.
  [[nodiscard]] virtual auto derive_key(TaskKind kind,
                                        const nlohmann::json& params) const
      -> std::string = 0;

  // Must not block on the work itself.
  virtual auto start(ExecutorRequest req, ExecutionSink sink) -> void = 0;

  // Best-effort; the attempt may still complete.
  virtual auto cancel(const AttemptId& attempt_id) -> void = 0;
};

[[nodiscard]] auto create_noop_executor() -> std::unique_ptr<IExecutor>;

}  // namespace adminq
