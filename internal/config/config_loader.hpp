#pragma once

#include <string>

#include "config/config.pb.h"

namespace clusterlink::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static clusterlink::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static clusterlink::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace clusterlink::config
