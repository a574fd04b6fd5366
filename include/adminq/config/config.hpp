#pragma once

#include "adminq/config/system_config.hpp"
#include "adminq/core/error.hpp"

#include <string>
#include <string_view>

namespace adminq {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Range checks that YAML decoding cannot express.
  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;

  // Non-default values only.
  [[nodiscard]] static auto dump(const SystemConfig& config) -> std::string;
};

}  // namespace adminq
