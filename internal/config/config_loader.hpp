#pragma once

#include <string>

#include "config/config.pb.h"

namespace lotcost::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the .proto is the
  single schema for the file. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static lotcost::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static lotcost::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // In-memory backend, default costing and pricing settings.
  static lotcost::runtime::config::RuntimeConfig Defaults();
};

} // namespace lotcost::config
