#pragma once

#include <string>

#include "config/config.pb.h"

namespace framecomp::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  are rejected. Zero / empty fields are then filled with the built-in
  defaults and the result is validated.
*/
class ConfigLoader {
 public:
  static framecomp::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static framecomp::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(framecomp::runtime::config::RuntimeConfig& config);

  // Throws util::ConfigurationError.
  static void Validate(const framecomp::runtime::config::RuntimeConfig& config);
};

} // namespace framecomp::config
