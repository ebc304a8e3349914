#pragma once

#include <string>

#include "config/config.pb.h"

namespace trailwatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset numeric fields are filled with defaults afterwards.
*/
class ConfigLoader {
 public:
  static trailwatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is given: watch the current directory.
  static trailwatch::runtime::config::RuntimeConfig Defaults();

  // Fills zero/empty fields with defaults, then validates.
  // Throws util::InvalidConfig on values that cannot be used.
  static void ApplyDefaults(trailwatch::runtime::config::RuntimeConfig& config);
};

} // namespace trailwatch::config
