#pragma once

#include <string>

#include "config/config.pb.h"

namespace soilhex::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Sections left out of
  the file are filled with the reference deployment's values.
*/
class ConfigLoader {
 public:
  static soilhex::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Reference deployment configuration, as used when no file is given.
  static soilhex::runtime::config::RuntimeConfig Defaults();

  // Fills unset sections and validates the result. Throws std::invalid_argument.
  static void ApplyDefaults(soilhex::runtime::config::RuntimeConfig& config);
};

} // namespace soilhex::config
