#pragma once

#include <string>

#include "config/config.pb.h"

namespace omni::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a google.protobuf.Value, rendered as JSON and parsed
  into the config message. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static omni::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static omni::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace omni::config
