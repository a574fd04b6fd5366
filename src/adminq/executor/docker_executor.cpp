#include "adminq/executor/docker_executor.hpp"

#include "adminq/core/constants.hpp"
#include "adminq/storage/state_strings.hpp"
#include "adminq/util/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <initializer_list>
#include <ranges>
#include <vector>

namespace adminq {

namespace {

using nlohmann::json;

constexpr std::array<std::string_view, 9> kFatalPatterns = {
    "unauthorized",
    "denied",
    "authentication required",
    "not found",
    "invalid reference",
    "manifest unknown",
    "no such image",
    "repository does not exist",
    "invalid argument",
};

auto has_whitespace(std::string_view s) -> bool {
  return std::ranges::any_of(
      s, [](unsigned char c) { return std::isspace(c) != 0; });
}

auto require_ref(const json& params, std::string_view field) -> Validation {
  auto it = params.find(std::string(field));
  if (it == params.end() || !it->is_string()) {
    return std::unexpected(std::format("'{}' is required and must be a string", field));
  }
  const auto& value = it->get_ref<const std::string&>();
  if (value.empty() || has_whitespace(value)) {
    return std::unexpected(std::format("'{}' must be a non-empty image reference", field));
  }
  return {};
}

auto optional_string(const json& params, std::string_view field)
    -> Validation {
  auto it = params.find(std::string(field));
  if (it != params.end() && !it->is_null() &&
      (!it->is_string() || it->get_ref<const std::string&>().empty())) {
    return std::unexpected(std::format("'{}' must be a non-empty string", field));
  }
  return {};
}

auto optional_bool(const json& params, std::string_view field) -> Validation {
  auto it = params.find(std::string(field));
  if (it != params.end() && !it->is_null() && !it->is_boolean()) {
    return std::unexpected(std::format("'{}' must be a boolean", field));
  }
  return {};
}

auto all_of(std::initializer_list<Validation> checks) -> Validation {
  for (const auto& check : checks) {
    if (!check) {
      return check;
    }
  }
  return {};
}

// Appends :latest when the last path component carries no tag or digest.
auto with_default_tag(std::string ref) -> std::string {
  auto slash = ref.rfind('/');
  auto last = slash == std::string::npos ? std::string_view{ref}
                                         : std::string_view{ref}.substr(slash + 1);
  if (last.find(':') == std::string_view::npos &&
      last.find('@') == std::string_view::npos) {
    ref += ":latest";
  }
  return ref;
}

// Drops a trailing ":tag" or "@digest" from the last path component.
auto repository_of(std::string ref) -> std::string {
  auto slash = ref.rfind('/');
  auto start = slash == std::string::npos ? 0 : slash + 1;
  if (auto at = ref.find('@', start); at != std::string::npos) {
    ref.resize(at);
  }
  if (auto colon = ref.find(':', start); colon != std::string::npos) {
    ref.resize(colon);
  }
  return ref;
}

auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Last few non-empty lines, for error reporting.
auto output_tail(std::string_view output, std::size_t max_lines = 5)
    -> std::string {
  std::vector<std::string_view> lines;
  for (auto part : output | std::views::split('\n')) {
    std::string_view line{part.begin(), part.end()};
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
      line.remove_suffix(1);
    }
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  auto first = lines.size() > max_lines ? lines.size() - max_lines : 0;
  std::string out;
  for (auto i = first; i < lines.size(); ++i) {
    if (!out.empty()) {
      out += "; ";
    }
    out += lines[i];
  }
  if (out.size() > limits::kMaxLogLineLength) {
    out.resize(limits::kMaxLogLineLength);
  }
  return out;
}

auto verb(TaskKind kind) -> std::string_view {
  switch (kind) {
    case TaskKind::DockerPush: return "push";
    case TaskKind::DockerBuild: return "build";
    case TaskKind::DockerPull: return "pull";
    case TaskKind::DockerTag: return "tag";
    default: return "unknown";
  }
}

auto build_tag(const json& params) -> std::string {
  auto tag = params.value("tag", std::string{});
  if (auto name = params.value("image_name", std::string{}); !name.empty()) {
    return std::format("{}:{}", name, tag.empty() ? "latest" : tag);
  }
  return tag;
}

auto parse_built_image_id(std::string_view output) -> std::optional<std::string> {
  for (std::string_view marker : {"writing image ", "Successfully built "}) {
    if (auto pos = output.rfind(marker); pos != std::string_view::npos) {
      auto rest = output.substr(pos + marker.size());
      auto end = rest.find_first_of(" \r\n");
      return std::string(rest.substr(0, end));
    }
  }
  return std::nullopt;
}

}  // namespace

auto docker_image_ref(const json& params) -> std::string {
  auto name = params.value("image_name", std::string{});
  auto tag = params.value("tag", std::string{});
  if (!tag.empty()) {
    return std::format("{}:{}", name, tag);
  }
  return with_default_tag(std::move(name));
}

auto parse_push_digest(std::string_view output) -> std::optional<std::string> {
  constexpr std::string_view marker = "digest: ";
  auto pos = output.find(marker);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  auto rest = output.substr(pos + marker.size());
  auto end = rest.find_first_of(" \t\r\n");
  auto digest = rest.substr(0, end);
  if (digest.empty()) {
    return std::nullopt;
  }
  return std::string(digest);
}

auto is_fatal_docker_error(std::string_view output) -> bool {
  auto lowered = to_lower(output);
  return std::ranges::any_of(kFatalPatterns, [&](std::string_view pattern) {
    return lowered.find(pattern) != std::string::npos;
  });
}

DockerExecutor::DockerExecutor(ExecutorsConfig config)
    : config_(std::move(config)) {
}

DockerExecutor::~DockerExecutor() {
  shutdown();
}

auto DockerExecutor::supports(TaskKind kind) const -> bool {
  return kind == TaskKind::DockerPush || kind == TaskKind::DockerBuild ||
         kind == TaskKind::DockerPull || kind == TaskKind::DockerTag;
}

auto DockerExecutor::validate(TaskKind kind, const json& params) const
    -> Validation {
  if (!params.is_object()) {
    return std::unexpected(std::string("params must be an object"));
  }

  switch (kind) {
    case TaskKind::DockerPush:
      return all_of({require_ref(params, "image_name"),
                    optional_string(params, "tag"),
                    optional_bool(params, "all_tags"),
                    optional_bool(params, "disable_content_trust"),
                    optional_bool(params, "quiet")});
    case TaskKind::DockerPull:
      return all_of({require_ref(params, "image_name"),
                    optional_string(params, "tag"),
                    optional_string(params, "platform")});
    case TaskKind::DockerTag:
      return all_of({require_ref(params, "source_image"),
                    require_ref(params, "target_image")});
    case TaskKind::DockerBuild: {
      auto it = params.find("context_path");
      if (it == params.end() || !it->is_string() ||
          it->get_ref<const std::string&>().empty()) {
        return std::unexpected(
            std::string("'context_path' is required and must be a string"));
      }
      if (auto args = params.find("build_args"); args != params.end()) {
        if (!args->is_object()) {
          return std::unexpected(std::string("'build_args' must be an object"));
        }
        for (const auto& [name, value] : args->items()) {
          if (!value.is_string()) {
            return std::unexpected(
                std::format("build arg '{}' must be a string", name));
          }
        }
      }
      return all_of({optional_string(params, "tag"),
                    optional_string(params, "image_name"),
                    optional_string(params, "dockerfile_path"),
                    optional_string(params, "platform"),
                    optional_string(params, "target"),
                    optional_bool(params, "no_cache")});
    }
    default:
      return std::unexpected(
          std::format("{} is not a docker task", task_kind_name(kind)));
  }
}

auto DockerExecutor::derive_key(TaskKind kind, const json& params) const
    -> std::string {
  switch (kind) {
    case TaskKind::DockerPush:
      // --all-tags writes every tag of the repository.
      if (params.value("all_tags", false)) {
        return std::format(
            "{}:*", repository_of(params.value("image_name", std::string{})));
      }
      return docker_image_ref(params);
    case TaskKind::DockerPull:
      return docker_image_ref(params);
    case TaskKind::DockerTag:
      return with_default_tag(params.value("target_image", std::string{}));
    case TaskKind::DockerBuild:
      if (auto tag = build_tag(params); !tag.empty()) {
        return with_default_tag(std::move(tag));
      }
      return std::format("build:{}", params.value("context_path", std::string{}));
    default:
      return {};
  }
}

auto DockerExecutor::start_step(const ExecutorRequest& req) const
    -> std::string {
  switch (req.kind) {
    case TaskKind::DockerPush:
      return std::format("Pushing {}", docker_image_ref(req.params));
    case TaskKind::DockerPull:
      return std::format("Pulling {}", docker_image_ref(req.params));
    case TaskKind::DockerBuild:
      return std::format("Building {}", req.params.value("context_path", ""));
    case TaskKind::DockerTag:
      return std::format("Tagging {}", req.params.value("target_image", ""));
    default:
      return CommandExecutor::start_step(req);
  }
}

auto DockerExecutor::build_command(const ExecutorRequest& req) const
    -> std::expected<ProcessSpec, std::string> {
  const auto& p = req.params;
  ProcessSpec spec;
  auto& argv = spec.argv;
  argv.push_back(config_.docker_binary);

  switch (req.kind) {
    case TaskKind::DockerPush: {
      argv.emplace_back("push");
      bool all_tags = p.value("all_tags", false);
      if (all_tags) {
        argv.emplace_back("--all-tags");
      }
      if (p.value("disable_content_trust", false)) {
        argv.emplace_back("--disable-content-trust");
      }
      if (p.value("quiet", false)) {
        argv.emplace_back("--quiet");
      }
      argv.push_back(all_tags ? p.value("image_name", std::string{})
                              : docker_image_ref(p));
      break;
    }
    case TaskKind::DockerPull:
      argv.emplace_back("pull");
      if (auto platform = p.value("platform", std::string{}); !platform.empty()) {
        argv.emplace_back("--platform");
        argv.push_back(std::move(platform));
      }
      argv.push_back(docker_image_ref(p));
      break;
    case TaskKind::DockerTag:
      argv.emplace_back("tag");
      argv.push_back(p.value("source_image", std::string{}));
      argv.push_back(p.value("target_image", std::string{}));
      break;
    case TaskKind::DockerBuild: {
      argv.emplace_back("build");
      argv.emplace_back("-f");
      argv.push_back(p.value("dockerfile_path", std::string{"Dockerfile"}));
      if (auto tag = build_tag(p); !tag.empty()) {
        argv.emplace_back("-t");
        argv.push_back(std::move(tag));
      }
      if (auto args = p.find("build_args"); args != p.end() && args->is_object()) {
        for (const auto& [name, value] : args->items()) {
          argv.emplace_back("--build-arg");
          argv.push_back(std::format("{}={}", name, value.get<std::string>()));
        }
      }
      if (p.value("no_cache", false)) {
        argv.emplace_back("--no-cache");
      }
      if (auto platform = p.value("platform", std::string{}); !platform.empty()) {
        argv.emplace_back("--platform");
        argv.push_back(std::move(platform));
      }
      if (auto target = p.value("target", std::string{}); !target.empty()) {
        argv.emplace_back("--target");
        argv.push_back(std::move(target));
      }
      auto context = p.value("context_path", std::string{});
      // -f and the build context both resolve inside context_path
      spec.working_dir = context;
      argv.emplace_back(".");
      break;
    }
    default:
      return std::unexpected(
          std::format("{} is not a docker task", task_kind_name(req.kind)));
  }
  return spec;
}

auto DockerExecutor::interpret(const ExecutorRequest& req,
                               const ProcessResult& result) const
    -> ExecutionOutcome {
  const auto& p = req.params;

  if (result.exit_code != 0) {
    auto reason = std::format("docker {} failed (exit {}): {}", verb(req.kind),
                              result.exit_code, output_tail(result.output));
    // 126/127: the binary is missing or not executable
    if (result.exit_code == 126 || result.exit_code == 127 ||
        is_fatal_docker_error(result.output)) {
      return ExecutionOutcome::fatal(std::move(reason));
    }
    return ExecutionOutcome::retryable(std::move(reason));
  }

  json out = {{"status", "success"}};
  switch (req.kind) {
    case TaskKind::DockerPush: {
      auto ref = docker_image_ref(p);
      out["message"] = "Docker image pushed successfully";
      out["image_name"] = p.value("image_name", std::string{});
      out["tag"] = p.value("tag", std::string{"latest"});
      out["full_image_name"] = ref;
      if (auto digest = parse_push_digest(result.output)) {
        out["digest"] = *digest;
      } else {
        out["digest"] = nullptr;
      }
      break;
    }
    case TaskKind::DockerPull:
      out["message"] = "Docker image pulled successfully";
      out["full_image_name"] = docker_image_ref(p);
      break;
    case TaskKind::DockerTag:
      out["message"] = "Docker image tagged successfully";
      out["source_image"] = p.value("source_image", std::string{});
      out["target_image"] = p.value("target_image", std::string{});
      break;
    case TaskKind::DockerBuild:
      out["message"] = "Docker image built successfully";
      out["tag"] = build_tag(p);
      if (auto id = parse_built_image_id(result.output)) {
        out["image_id"] = *id;
      }
      break;
    default:
      break;
  }
  return ExecutionOutcome::success(std::move(out));
}

auto create_docker_executor(const ExecutorsConfig& config)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<DockerExecutor>(config);
}

}  // namespace adminq
