#pragma once

#include <string>

#include "config/config.pb.h"

namespace soundscribe::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left unset
  in the file are filled by ApplyDefaults before validation.
*/
class ConfigLoader {
 public:
  static soundscribe::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(soundscribe::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument describing the first bad field.
  static void Validate(const soundscribe::runtime::config::RuntimeConfig& config);
};

} // namespace soundscribe::config
