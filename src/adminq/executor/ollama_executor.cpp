#include "adminq/executor/ollama_executor.hpp"

#include "adminq/storage/state_strings.hpp"

#include <format>

namespace adminq {

namespace {

using nlohmann::json;

auto require_model(const json& params) -> Validation {
  auto it = params.find("model_name");
  if (it == params.end() || !it->is_string() ||
      it->get_ref<const std::string&>().empty()) {
    return std::unexpected(
        std::string("'model_name' is required and must be a string"));
  }
  return {};
}

auto last_line(std::string_view output) -> std::string_view {
  while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
    output.remove_suffix(1);
  }
  auto pos = output.find_last_of("\r\n");
  return pos == std::string_view::npos ? output : output.substr(pos + 1);
}

}  // namespace

OllamaExecutor::OllamaExecutor(ExecutorsConfig config)
    : config_(std::move(config)) {
}

OllamaExecutor::~OllamaExecutor() {
  shutdown();
}

auto OllamaExecutor::supports(TaskKind kind) const -> bool {
  return kind == TaskKind::OllamaPull || kind == TaskKind::OllamaRun;
}

auto OllamaExecutor::validate(TaskKind kind, const json& params) const
    -> Validation {
  if (!params.is_object()) {
    return std::unexpected(std::string("params must be an object"));
  }
  if (auto r = require_model(params); !r) {
    return r;
  }

  if (kind == TaskKind::OllamaRun) {
    auto prompt = params.find("prompt");
    if (prompt == params.end() || !prompt->is_string()) {
      return std::unexpected(
          std::string("'prompt' is required and must be a string"));
    }
    if (auto it = params.find("max_tokens");
        it != params.end() && (!it->is_number_integer() || it->get<int>() < 1)) {
      return std::unexpected(std::string("'max_tokens' must be a positive integer"));
    }
    if (auto it = params.find("temperature");
        it != params.end() && !it->is_number()) {
      return std::unexpected(std::string("'temperature' must be a number"));
    }
    return {};
  }
  if (kind == TaskKind::OllamaPull) {
    return {};
  }
  return std::unexpected(
      std::format("{} is not an ollama task", task_kind_name(kind)));
}

auto OllamaExecutor::derive_key(TaskKind kind, const json& params) const
    -> std::string {
  auto model = params.value("model_name", std::string{});
  return kind == TaskKind::OllamaPull ? std::format("ollama:{}", model)
                                      : std::format("ollama-run:{}", model);
}

auto OllamaExecutor::start_step(const ExecutorRequest& req) const
    -> std::string {
  auto model = req.params.value("model_name", std::string{});
  return req.kind == TaskKind::OllamaPull
             ? std::format("Pulling Ollama model {}", model)
             : std::format("Running inference with {}", model);
}

auto OllamaExecutor::build_command(const ExecutorRequest& req) const
    -> std::expected<ProcessSpec, std::string> {
  const auto& p = req.params;
  auto model = p.value("model_name", std::string{});
  ProcessSpec spec;

  if (req.kind == TaskKind::OllamaPull) {
    spec.argv = {config_.ollama_binary, "pull", model};
    if (!config_.ollama_models_path.empty()) {
      spec.env.emplace_back("OLLAMA_MODELS", config_.ollama_models_path);
    }
    return spec;
  }

  if (req.kind == TaskKind::OllamaRun) {
    json body = {
        {"model", model},
        {"prompt", p.value("prompt", std::string{})},
        {"stream", false},
        {"options",
         {{"num_predict", p.value("max_tokens", 1000)},
          {"temperature", p.value("temperature", 0.7)}}},
    };
    spec.argv = {config_.curl_binary,
                 "-sS",
                 "--fail-with-body",
                 "-X",
                 "POST",
                 std::format("{}/api/generate", config_.ollama_url),
                 "-H",
                 "Content-Type: application/json",
                 "-d",
                 body.dump()};
    return spec;
  }

  return std::unexpected(
      std::format("{} is not an ollama task", task_kind_name(req.kind)));
}

auto OllamaExecutor::interpret(const ExecutorRequest& req,
                               const ProcessResult& result) const
    -> ExecutionOutcome {
  auto model = req.params.value("model_name", std::string{});

  if (req.kind == TaskKind::OllamaPull) {
    if (result.exit_code != 0) {
      auto reason = std::format("Ollama pull failed (exit {}): {}",
                                result.exit_code, last_line(result.output));
      if (result.output.find("file does not exist") != std::string::npos ||
          result.exit_code == 127) {
        return ExecutionOutcome::fatal(std::move(reason));
      }
      return ExecutionOutcome::retryable(std::move(reason));
    }
    return ExecutionOutcome::success(
        {{"status", "success"},
         {"message", std::format("Ollama model {} pulled successfully", model)},
         {"model_name", model}});
  }

  // curl: 6/7 cannot resolve or connect, 28 timeout, 22 HTTP error status
  if (result.exit_code != 0) {
    auto reason = std::format("Ollama inference failed (curl exit {}): {}",
                              result.exit_code, last_line(result.output));
    if (result.exit_code == 127) {
      return ExecutionOutcome::fatal(std::move(reason));
    }
    return ExecutionOutcome::retryable(std::move(reason));
  }

  auto response = json::parse(result.output, nullptr, false);
  if (response.is_discarded() || !response.is_object()) {
    return ExecutionOutcome::fatal("Invalid JSON response from Ollama");
  }
  if (auto err = response.find("error"); err != response.end()) {
    return ExecutionOutcome::fatal(
        std::format("Ollama error: {}", err->is_string() ? err->get<std::string>()
                                                         : err->dump()));
  }

  auto eval_count = response.value("eval_count", 0.0);
  auto eval_duration = response.value("eval_duration", 0.0);
  return ExecutionOutcome::success({
      {"status", "success"},
      {"message", std::format("Inference completed with model {}", model)},
      {"model_name", model},
      {"generated_text", response.value("response", std::string{})},
      {"prompt_tokens", response.value("prompt_eval_count", 0)},
      {"generated_tokens", response.value("eval_count", 0)},
      {"total_duration", response.value("total_duration", 0)},
      {"tokens_per_second",
       eval_duration > 0 ? eval_count / (eval_duration / 1e9) : 0.0},
  });
}

auto create_ollama_executor(const ExecutorsConfig& config)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<OllamaExecutor>(config);
}

}  // namespace adminq
