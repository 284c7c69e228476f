#pragma once

#include <string>

#include "config/config.pb.h"

namespace mediacache::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Fields left at zero are filled with the built-in defaults.
*/
class ConfigLoader {
 public:
  static mediacache::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(mediacache::runtime::config::RuntimeConfig& config);
};

} // namespace mediacache::config
