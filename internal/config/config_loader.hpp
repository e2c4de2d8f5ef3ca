#pragma once

#include <string>

#include "config/config.pb.h"

namespace sealbench::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Load() falls back to $SEALBENCH_CONFIG and then to Defaults()
  when no path is given.
*/
class ConfigLoader {
 public:
  static sealbench::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static sealbench::runtime::config::RuntimeConfig Load(const std::string& path);

  static sealbench::runtime::config::RuntimeConfig Defaults();
};

} // namespace sealbench::config
