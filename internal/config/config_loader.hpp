#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"

namespace auklet::config {

/*
  Builds the RuntimeConfig.

  An optional YAML file is converted to JSON then parsed into protobuf.
  AUKLET_* environment variables override the file, defaults fill the rest,
  and Validate() rejects a config missing any required value.
*/
class ConfigLoader {
 public:
  static auklet::runtime::config::RuntimeConfig Load(const std::optional<std::string>& yaml_path);

  static auklet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static void ApplyEnvironment(auklet::runtime::config::RuntimeConfig* config);
  static void ApplyDefaults(auklet::runtime::config::RuntimeConfig* config);

  // Throws ConfigError naming every missing variable.
  static void Validate(const auklet::runtime::config::RuntimeConfig& config);
};

} // namespace auklet::config
