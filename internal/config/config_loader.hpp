#pragma once

#include <string>

#include "config/config.pb.h"

namespace cadence::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static cadence::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace cadence::config
