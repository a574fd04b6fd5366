#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace adminq {

struct StorageConfig {
  // Empty keeps tasks in memory only.
  std::string db_file{"adminq.db"};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
  std::string pid_file;
};

struct QueueConfig {
  int concurrency{2};
  int max_attempts{3};
  int base_backoff_ms{1000};
  int max_backoff_ms{60000};
  int attempt_timeout_sec{1800};
  int cancel_poll_ms{100};
  int retention_seconds{86400};
  std::size_t max_retained{10000};
};

struct ApiConfig {
  bool enabled{true};
  uint16_t port{8060};
  std::string host{"127.0.0.1"};
};

struct ExecutorsConfig {
  std::string docker_binary{"docker"};
  std::string ollama_binary{"ollama"};
  std::string curl_binary{"curl"};
  std::string ollama_url{"http://localhost:11434"};
  std::string ollama_models_path;
  // Accept and complete every task without running anything.
  bool dry_run{false};
};

struct SystemConfig {
  StorageConfig storage;
  LoggingConfig logging;
  QueueConfig queue;
  ApiConfig api;
  ExecutorsConfig executors;
};

}  // namespace adminq
