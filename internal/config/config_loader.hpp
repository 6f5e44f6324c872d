#pragma once

#include <string>

#include "config/config.pb.h"

namespace x402::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are errors.
*/
class ConfigLoader {
 public:
  static x402::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static x402::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace x402::config
