#pragma once

#include <string>

#include "config/config.pb.h"

namespace typelog::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static typelog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static typelog::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace typelog::config
