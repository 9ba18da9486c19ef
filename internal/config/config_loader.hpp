#pragma once

#include <string>

#include "config/config.pb.h"

namespace meshgraph::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Missing fields get
  their defaults; Validate() rejects values the binaries cannot run with.
  All failures are reported as util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static meshgraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static meshgraph::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Defaults for an absent config file.
  static meshgraph::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(meshgraph::runtime::config::RuntimeConfig& config);
  static void Validate(const meshgraph::runtime::config::RuntimeConfig& config);
};

} // namespace meshgraph::config
