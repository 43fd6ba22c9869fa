#pragma once

#include "conductor/config/system_config.hpp"
#include "conductor/core/error.hpp"

#include <string>
#include <string_view>

namespace conductor {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  // Malformed YAML or an unknown enum name is ParseError; well-formed but
  // out-of-range values are InvalidArgument.
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;

  // Emits only values that differ from the defaults.
  [[nodiscard]] static auto to_yaml(const SystemConfig& config) -> std::string;
};

}  // namespace conductor
