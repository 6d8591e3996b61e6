#pragma once

#include <string>

#include "config/config.pb.h"

namespace signoff::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected so typos in a config file fail fast instead of silently falling
  back to defaults.
*/
class ConfigLoader {
 public:
  static signoff::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static signoff::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // Throws std::runtime_error on semantically invalid values.
  static void Validate(const signoff::runtime::config::RuntimeConfig& config);
};

} // namespace signoff::config
