#include "adminq/config/config.hpp"

#include "adminq/config/yaml_utils.hpp"
#include "adminq/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<adminq::StorageConfig> {
  static bool decode(const Node& node, adminq::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = adminq::yaml_get_or<std::string>(node, "db_file", "adminq.db");
    return true;
  }
};

template <>
struct convert<adminq::LoggingConfig> {
  static bool decode(const Node& node, adminq::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = adminq::yaml_get_or<std::string>(node, "level", "info");
    l.file = adminq::yaml_get_or<std::string>(node, "file", "");
    l.pid_file = adminq::yaml_get_or<std::string>(node, "pid_file", "");
    return true;
  }
};

template <>
struct convert<adminq::QueueConfig> {
  static bool decode(const Node& node, adminq::QueueConfig& q) {
    if (!node.IsMap()) {
      return false;
    }
    q.concurrency = adminq::yaml_get_or(node, "concurrency", 2);
    q.max_attempts = adminq::yaml_get_or(node, "max_attempts", 3);
    q.base_backoff_ms = adminq::yaml_get_or(node, "base_backoff_ms", 1000);
    q.max_backoff_ms = adminq::yaml_get_or(node, "max_backoff_ms", 60000);
    q.attempt_timeout_sec = adminq::yaml_get_or(node, "attempt_timeout_sec", 1800);
    q.cancel_poll_ms = adminq::yaml_get_or(node, "cancel_poll_ms", 100);
    q.retention_seconds = adminq::yaml_get_or(node, "retention_seconds", 86400);
    q.max_retained =
        adminq::yaml_get_or<std::size_t>(node, "max_retained", 10000);
    return true;
  }
};

template <>
struct convert<adminq::ApiConfig> {
  static bool decode(const Node& node, adminq::ApiConfig& a) {
    if (!node.IsMap()) {
      return false;
    }
    a.enabled = adminq::yaml_get_or(node, "enabled", true);
    a.port = adminq::yaml_get_or<uint16_t>(node, "port", 8060);
    a.host = adminq::yaml_get_or<std::string>(node, "host", "127.0.0.1");
    return true;
  }
};

template <>
struct convert<adminq::ExecutorsConfig> {
  static bool decode(const Node& node, adminq::ExecutorsConfig& e) {
    if (!node.IsMap()) {
      return false;
    }
    e.docker_binary =
        adminq::yaml_get_or<std::string>(node, "docker_binary", "docker");
    e.ollama_binary =
        adminq::yaml_get_or<std::string>(node, "ollama_binary", "ollama");
    e.curl_binary = adminq::yaml_get_or<std::string>(node, "curl_binary", "curl");
    e.ollama_url = adminq::yaml_get_or<std::string>(node, "ollama_url",
                                                    "http://localhost:11434");
    e.ollama_models_path =
        adminq::yaml_get_or<std::string>(node, "ollama_models_path", "");
    e.dry_run = adminq::yaml_get_or(node, "dry_run", false);
    return true;
  }
};

template <>
struct convert<adminq::SystemConfig> {
  static bool decode(const Node& node, adminq::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<adminq::StorageConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<adminq::LoggingConfig>();
    }
    if (auto queue = node["queue"]) {
      c.queue = queue.as<adminq::QueueConfig>();
    }
    if (auto api = node["api"]) {
      c.api = api.as<adminq::ApiConfig>();
    }
    if (auto executors = node["executors"]) {
      c.executors = executors.as<adminq::ExecutorsConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace adminq {

namespace {

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "db_file", s.db_file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LoggingConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  yaml_emit_if_not_empty(out, "file", l.file);
  yaml_emit_if_not_empty(out, "pid_file", l.pid_file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const QueueConfig& q) {
  const QueueConfig defaults;
  out << YAML::BeginMap;
  yaml_emit(out, "concurrency", q.concurrency);
  yaml_emit(out, "max_attempts", q.max_attempts);
  if (q.base_backoff_ms != defaults.base_backoff_ms) {
    yaml_emit(out, "base_backoff_ms", q.base_backoff_ms);
  }
  if (q.max_backoff_ms != defaults.max_backoff_ms) {
    yaml_emit(out, "max_backoff_ms", q.max_backoff_ms);
  }
  if (q.attempt_timeout_sec != defaults.attempt_timeout_sec) {
    yaml_emit(out, "attempt_timeout_sec", q.attempt_timeout_sec);
  }
  if (q.cancel_poll_ms != defaults.cancel_poll_ms) {
    yaml_emit(out, "cancel_poll_ms", q.cancel_poll_ms);
  }
  if (q.retention_seconds != defaults.retention_seconds) {
    yaml_emit(out, "retention_seconds", q.retention_seconds);
  }
  if (q.max_retained != defaults.max_retained) {
    yaml_emit(out, "max_retained", q.max_retained);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ApiConfig& a) {
  out << YAML::BeginMap;
  yaml_emit(out, "enabled", a.enabled);
  if (a.port != 8060) {
    yaml_emit(out, "port", a.port);
  }
  if (a.host != "127.0.0.1") {
    yaml_emit(out, "host", a.host);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ExecutorsConfig& e) {
  const ExecutorsConfig defaults;
  out << YAML::BeginMap;
  if (e.docker_binary != defaults.docker_binary) {
    yaml_emit(out, "docker_binary", e.docker_binary);
  }
  if (e.ollama_binary != defaults.ollama_binary) {
    yaml_emit(out, "ollama_binary", e.ollama_binary);
  }
  if (e.curl_binary != defaults.curl_binary) {
    yaml_emit(out, "curl_binary", e.curl_binary);
  }
  if (e.ollama_url != defaults.ollama_url) {
    yaml_emit(out, "ollama_url", e.ollama_url);
  }
  yaml_emit_if_not_empty(out, "ollama_models_path", e.ollama_models_path);
  if (e.dry_run) {
    yaml_emit(out, "dry_run", e.dry_run);
  }
  out << YAML::EndMap;
}

auto reject(std::string_view field, std::string_view why) -> Result<void> {
  log::error("Invalid config: {} {}", field, why);
  return fail(Error::ValidationError);
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    if (auto r = validate(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  const auto& q = config.queue;
  if (q.concurrency < 1) {
    return reject("queue.concurrency", "must be at least 1");
  }
  if (q.max_attempts < 1) {
    return reject("queue.max_attempts", "must be at least 1");
  }
  if (q.base_backoff_ms < 0 || q.max_backoff_ms < 0) {
    return reject("queue.*_backoff_ms", "must not be negative");
  }
  if (q.max_backoff_ms < q.base_backoff_ms) {
    return reject("queue.max_backoff_ms", "must not be below base_backoff_ms");
  }
  if (q.attempt_timeout_sec < 1) {
    return reject("queue.attempt_timeout_sec", "must be at least 1");
  }
  if (q.cancel_poll_ms < 1) {
    return reject("queue.cancel_poll_ms", "must be at least 1");
  }
  if (q.retention_seconds < 0) {
    return reject("queue.retention_seconds", "must not be negative");
  }
  if (config.api.enabled && config.api.port == 0) {
    return reject("api.port", "must be set when the API is enabled");
  }
  return ok();
}

auto ConfigLoader::dump(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "logging" << YAML::Value;
  to_yaml(out, config.logging);
  out << YAML::Key << "queue" << YAML::Value;
  to_yaml(out, config.queue);
  out << YAML::Key << "api" << YAML::Value;
  to_yaml(out, config.api);
  out << YAML::Key << "executors" << YAML::Value;
  to_yaml(out, config.executors);
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace adminq
