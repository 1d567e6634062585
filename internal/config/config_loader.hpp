#pragma once

#include <string>

#include "config/config.pb.h"

namespace normbalance::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Fields left unset get the engine defaults (ApplyDefaults).
*/
class ConfigLoader {
 public:
  static normbalance::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Parses YAML text directly; used by LoadFromYaml and tests.
  static normbalance::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // Fills zero-valued fields and rejects out-of-range ones (std::runtime_error).
  static void ApplyDefaults(normbalance::runtime::config::RuntimeConfig& config);
};

} // namespace normbalance::config
