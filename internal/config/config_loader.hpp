#pragma once

#include <string>

#include "config/config.pb.h"

namespace dsnp::config {

/*
  Loads RuntimeConfig from a YAML file or YAML text.

  YAML is converted to JSON then parsed into protobuf, so field names and
  enum spellings follow config/config.proto. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static dsnp::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static dsnp::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace dsnp::config
