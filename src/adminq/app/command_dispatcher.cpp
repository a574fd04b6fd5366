#include "adminq/app/command_dispatcher.hpp"

#include "adminq/storage/state_strings.hpp"
#include "adminq/util/log.hpp"
#include "adminq/util/time.hpp"

#include <algorithm>
#include <format>

namespace adminq {

using json = nlohmann::json;

namespace {

auto invalid(std::string message) -> std::unexpected<CommandError> {
  return std::unexpected(
      CommandError{std::string(error_code::kValidation), std::move(message)});
}

auto not_found(std::string_view task_id) -> std::unexpected<CommandError> {
  return std::unexpected(CommandError{std::string(error_code::kTaskNotFound),
                                      std::format("Task {} not found", task_id)});
}

auto optional_time(const std::optional<std::chrono::system_clock::time_point>& tp)
    -> json {
  return tp ? json(format_timestamp(*tp)) : json(nullptr);
}

auto require_task_id(const json& params) -> std::expected<TaskId, CommandError> {
  auto it = params.find("task_id");
  if (it == params.end() || !it->is_string() ||
      it->get_ref<const std::string&>().empty()) {
    return invalid("task_id is required");
  }
  return TaskId{it->get<std::string>()};
}

auto optional_bool(const json& params, const char* name) -> bool {
  auto it = params.find(name);
  return it != params.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace

auto to_reply(const CommandResult& result) -> json {
  if (result) {
    return *result;
  }
  return {{"error",
           {{"code", result.error().code}, {"message", result.error().message}}}};
}

auto snapshot_to_json(const TaskSnapshot& task, bool include_logs) -> json {
  json j = {
      {"id", task.id.str()},
      {"kind", task_kind_name(task.kind)},
      {"key", task.key},
      {"state", task_state_name(task.state)},
      {"attempt_count", task.attempt_count},
      {"params", task.params},
      {"created_at", format_timestamp(task.created_at)},
      {"started_at", optional_time(task.started_at)},
      {"finished_at", optional_time(task.finished_at)},
      {"result", task.result ? *task.result : json(nullptr)},
      {"cancel_requested", task.cancel_requested},
      {"progress", task.progress},
      {"current_step", task.current_step},
  };

  if (auto d = task.duration()) {
    j["duration"] = static_cast<double>(d->count()) / 1000.0;
  } else {
    j["duration"] = nullptr;
  }

  if (include_logs) {
    json logs = json::array();
    for (const auto& entry : task.logs) {
      logs.push_back(
          {{"timestamp", format_timestamp(entry.at)}, {"message", entry.message}});
    }
    j["logs"] = std::move(logs);
  }
  return j;
}

CommandDispatcher::CommandDispatcher(QueueManager& queue) : queue_(queue) {
  register_commands();
}

auto CommandDispatcher::register_commands() -> void {
  handlers_.emplace("queue_submit",
                    [this](const json& p) { return queue_submit(p); });
  handlers_.emplace("queue_push", [this](const json& p) { return queue_push(p); });
  handlers_.emplace("queue_task_status",
                    [this](const json& p) { return queue_task_status(p); });
  handlers_.emplace("queue_status",
                    [this](const json& p) { return queue_status(p); });
  handlers_.emplace("queue_cancel",
                    [this](const json& p) { return queue_cancel(p); });
  handlers_.emplace("queue_clear", [this](const json& p) { return queue_clear(p); });
  handlers_.emplace("queue_pause", [this](const json& p) { return queue_pause(p); });
  handlers_.emplace("queue_resume",
                    [this](const json& p) { return queue_resume(p); });
}

auto CommandDispatcher::commands() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(handlers_.size());
  for (const auto& [name, _] : handlers_) {
    names.push_back(name);
  }
  std::ranges::sort(names);
  return names;
}

auto CommandDispatcher::dispatch(std::string_view command,
                                 const json& params) const -> CommandResult {
  auto it = handlers_.find(command);
  if (it == handlers_.end()) {
    return std::unexpected(
        CommandError{std::string(error_code::kUnknownCommand),
                     std::format("Unknown command: {}", command)});
  }

  const json& args = params.is_null() ? json::object() : params;
  if (!args.is_object()) {
    return invalid("params must be an object");
  }

  try {
    return it->second(args);
  } catch (const json::exception& e) {
    log::warn("Command {} rejected: {}", command, e.what());
    return invalid(e.what());
  }
}

auto CommandDispatcher::submit_error(std::error_code ec, std::string_view kind,
                                     const json& params) const -> CommandError {
  if (ec == make_error_code(Error::ValidationError)) {
    auto reason = queue_.explain_rejection(kind, params);
    return {std::string(error_code::kValidation),
            reason.empty() ? ec.message() : reason};
  }
  return {std::string(error_code::kQueue),
          std::format("Error adding task to queue: {}", ec.message())};
}

auto CommandDispatcher::queue_submit(const json& params) -> CommandResult {
  auto kind = params.value("kind", std::string{});
  if (kind.empty()) {
    return invalid("kind is required");
  }
  auto key = params.value("key", std::string{});
  json task_params = params.value("params", json::object());
  if (!task_params.is_object()) {
    return invalid("params must be an object");
  }

  auto id = queue_.submit(kind, key, task_params);
  if (!id) {
    return std::unexpected(submit_error(id.error(), kind, task_params));
  }

  auto snap = queue_.status(*id);
  return json{
      {"status", "success"},
      {"message", "Task added to queue"},
      {"task_id", id->str()},
      {"kind", kind},
      {"key", snap ? json(snap->key) : json(nullptr)},
      {"timestamp", format_timestamp()},
  };
}

auto CommandDispatcher::queue_push(const json& params) -> CommandResult {
  auto image = params.value("image_name", std::string{});
  if (image.empty()) {
    return invalid("Image name is required");
  }
  auto tag = params.value("tag", std::string{"latest"});

  json push = {
      {"image_name", image},
      {"tag", tag},
      {"all_tags", optional_bool(params, "all_tags")},
      {"disable_content_trust", optional_bool(params, "disable_content_trust")},
      {"quiet", optional_bool(params, "quiet")},
  };

  auto kind = task_kind_name(TaskKind::DockerPush);
  auto id = queue_.submit(TaskKind::DockerPush, params.value("key", std::string{}),
                          push);
  if (!id) {
    return std::unexpected(submit_error(id.error(), kind, push));
  }

  return json{
      {"status", "success"},
      {"message", "Docker push task added to queue"},
      {"task_id", id->str()},
      {"image_name", image},
      {"tag", tag},
      {"timestamp", format_timestamp()},
      {"note", "Use 'queue_task_status' command to monitor progress"},
  };
}

auto CommandDispatcher::queue_task_status(const json& params) -> CommandResult {
  auto id = require_task_id(params);
  if (!id) {
    return std::unexpected(id.error());
  }

  auto snap = queue_.status(*id);
  if (!snap) {
    return not_found(id->str());
  }

  return json{
      {"status", "success"},
      {"task", snapshot_to_json(*snap, optional_bool(params, "include_logs"))},
      {"timestamp", format_timestamp()},
  };
}

auto CommandDispatcher::queue_status(const json& params) -> CommandResult {
  TaskFilter filter;
  if (auto it = params.find("state"); it != params.end() && !it->is_null()) {
    auto name = it->get<std::string>();
    auto state = parse_task_state(name);
    if (!state) {
      return invalid(std::format("unknown state '{}'", name));
    }
    filter.state = state;
  }
  if (auto it = params.find("key"); it != params.end() && !it->is_null()) {
    filter.key = it->get<std::string>();
  }
  if (auto it = params.find("limit"); it != params.end() && !it->is_null()) {
    auto limit = it->get<long long>();
    if (limit < 0) {
      return invalid("limit must not be negative");
    }
    filter.limit = static_cast<std::size_t>(limit);
  }
  bool include_logs = optional_bool(params, "include_logs");

  auto stats = queue_.stats();
  json statistics = {
      {"total", stats.counts.total()},
      {"pending", stats.counts[TaskState::Pending]},
      {"running", stats.counts[TaskState::Running]},
      {"succeeded", stats.counts[TaskState::Succeeded]},
      {"failed", stats.counts[TaskState::Failed]},
      {"cancelled", stats.counts[TaskState::Cancelled]},
      {"queued", stats.pending},
      {"concurrency", stats.concurrency},
      {"paused", stats.paused},
  };

  json tasks = json::array();
  json running = json::array();
  for (const auto& task : queue_.list_status(filter)) {
    auto j = snapshot_to_json(task, include_logs);
    if (task.state == TaskState::Running) {
      running.push_back(j);
    }
    tasks.push_back(std::move(j));
  }

  return json{
      {"status", "success"},
      {"message", "Queue status retrieved successfully"},
      {"queue_status",
       {{"statistics", std::move(statistics)},
        {"tasks", std::move(tasks)},
        {"running_tasks", std::move(running)}}},
      {"timestamp", format_timestamp()},
  };
}

auto CommandDispatcher::queue_cancel(const json& params) -> CommandResult {
  auto id = require_task_id(params);
  if (!id) {
    return std::unexpected(id.error());
  }

  auto outcome = queue_.cancel(*id);
  if (!outcome) {
    if (outcome.error() == make_error_code(Error::NotFound)) {
      return not_found(id->str());
    }
    return std::unexpected(CommandError{std::string(error_code::kQueue),
                                        outcome.error().message()});
  }

  std::string message;
  switch (outcome->disposition) {
    case CancelDisposition::Cancelled:
      message = "Task cancelled";
      break;
    case CancelDisposition::CancellationRequested:
      message = "Cancellation requested; the running attempt will be abandoned";
      break;
    case CancelDisposition::AlreadyTerminal:
      message = std::format("Task already {}", task_state_name(outcome->state));
      break;
  }

  json reply{
      {"status", "success"},
      {"task_id", id->str()},
      {"accepted", outcome->accepted()},
      {"disposition", std::string(cancel_disposition_name(outcome->disposition))},
      {"state", task_state_name(outcome->state)},
      {"message", message},
  };
  // Only a settled task has a final state; a running one is still deciding.
  if (is_terminal(outcome->state)) {
    reply["final_state"] = task_state_name(outcome->state);
  }
  return reply;
}

auto CommandDispatcher::queue_clear(const json&) -> CommandResult {
  auto cleared = queue_.clear_completed();
  return json{
      {"status", "success"},
      {"cleared", cleared},
      {"message", std::format("Cleared {} finished tasks", cleared)},
  };
}

auto CommandDispatcher::queue_pause(const json&) -> CommandResult {
  queue_.pause();
  return json{{"status", "success"}, {"paused", true}};
}

auto CommandDispatcher::queue_resume(const json&) -> CommandResult {
  queue_.resume();
  return json{{"status", "success"}, {"paused", false}};
}

}  // namespace adminq
