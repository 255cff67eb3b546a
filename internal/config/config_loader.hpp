#pragma once

#include <string>

#include "config/config.pb.h"

namespace crumbtrail::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Environment overrides and defaults are applied after parsing.
*/
class ConfigLoader {
 public:
  static crumbtrail::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset fields with defaults and validates required ones.
  static void ApplyDefaults(crumbtrail::runtime::config::RuntimeConfig* config);
};

} // namespace crumbtrail::config
