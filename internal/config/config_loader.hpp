#pragma once

#include <string>

#include "config/config.pb.h"

namespace aoef::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to a protobuf Value, printed as JSON, then parsed into
  RuntimeConfig. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static aoef::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion on an in-memory YAML document.
  static aoef::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace aoef::config
