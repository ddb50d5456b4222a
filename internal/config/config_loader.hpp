#pragma once

#include <string>

#include "config/config.pb.h"

namespace engram::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Throws util::ConfigError.
*/
class ConfigLoader {
 public:
  static engram::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static engram::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace engram::config
