#pragma once

#include <string>

#include "config/config.pb.h"

namespace proposal::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields
  are rejected. ApplyDefaults() fills every value left unset.
*/
class ConfigLoader {
 public:
  static proposal::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static proposal::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(proposal::runtime::config::RuntimeConfig& config);
};

} // namespace proposal::config
