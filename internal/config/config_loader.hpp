#pragma once

#include <string>

#include "config/config.pb.h"

namespace beacon::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static beacon::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static beacon::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace beacon::config
