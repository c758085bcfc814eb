#pragma once

#include <string>

#include "config/config.pb.h"

namespace buildq::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Load* functions return the config with defaults applied and
  validated, so callers never see a zero worker count.
*/
class ConfigLoader {
 public:
  static buildq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static buildq::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills every unset field with its default. Explicit values are kept.
  static void ApplyDefaults(buildq::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidArgument describing the first bad field.
  static void Validate(const buildq::runtime::config::RuntimeConfig& config);
};

} // namespace buildq::config
