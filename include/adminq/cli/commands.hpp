#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace adminq::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> db_file;
  std::optional<uint16_t> port;
  bool no_api{false};
  bool daemon{false};
  bool dry_run{false};
};

struct ListOptions {
  std::string db_file{"adminq.db"};
  std::string state;
  std::string key;
  std::size_t limit{50};
};

struct ValidateOptions {
  std::string config_file;
};

struct StatusOptions {
  std::string db_file{"adminq.db"};
  std::string task_id;
};

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;

}  // namespace adminq::cli
