#pragma once

#include "adminq/queue/queue_manager.hpp"
#include "adminq/queue/task.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace adminq {

namespace error_code {
inline constexpr std::string_view kValidation = "VALIDATION_ERROR";
inline constexpr std::string_view kTaskNotFound = "TASK_NOT_FOUND";
inline constexpr std::string_view kQueue = "QUEUE_ERROR";
inline constexpr std::string_view kUnknownCommand = "UNKNOWN_COMMAND";
}  // namespace error_code

struct CommandError {
  std::string code;
  std::string message;
};

using CommandResult = std::expected<nlohmann::json, CommandError>;

// {"error": {"code", "message"}} on failure, the payload otherwise.
[[nodiscard]] auto to_reply(const CommandResult& result) -> nlohmann::json;

[[nodiscard]] auto snapshot_to_json(const TaskSnapshot& task,
                                    bool include_logs = false)
    -> nlohmann::json;

// Named JSON commands over a QueueManager. Stateless apart from the
// registration table; safe to call from any thread.
class CommandDispatcher {
public:
  using Handler = std::function<CommandResult(const nlohmann::json& params)>;

  explicit CommandDispatcher(QueueManager& queue);

  CommandDispatcher(const CommandDispatcher&) = delete;
  auto operator=(const CommandDispatcher&) -> CommandDispatcher& = delete;

  [[nodiscard]] auto dispatch(std::string_view command,
                              const nlohmann::json& params) const
      -> CommandResult;

  [[nodiscard]] auto commands() const -> std::vector<std::string>;

private:
  auto register_commands() -> void;

  auto queue_submit(const nlohmann::json& params) -> CommandResult;
  auto queue_push(const nlohmann::json& params) -> CommandResult;
  auto queue_task_status(const nlohmann::json& params) -> CommandResult;
  auto queue_status(const nlohmann::json& params) -> CommandResult;
  auto queue_cancel(const nlohmann::json& params) -> CommandResult;
  auto queue_clear(const nlohmann::json& params) -> CommandResult;
  auto queue_pause(const nlohmann::json& params) -> CommandResult;
  auto queue_resume(const nlohmann::json& params) -> CommandResult;

  auto submit_error(std::error_code ec, std::string_view kind,
                    const nlohmann::json& params) const -> CommandError;

  QueueManager& queue_;
  std::unordered_map<std::string, Handler, StringHash, StringEqual> handlers_;
};

}  // namespace adminq
