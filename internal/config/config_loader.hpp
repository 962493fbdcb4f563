#pragma once

#include <string>

#include "config/config.pb.h"

namespace payday::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static payday::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset tuning knobs with their defaults.
  static void ApplyDefaults(payday::runtime::config::RuntimeConfig& config);
};

} // namespace payday::config
