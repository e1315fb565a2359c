#pragma once

#include <string>

#include "config/config.pb.h"

namespace stateshift::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static stateshift::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in defaults for every field the core reads.
  static stateshift::runtime::config::RuntimeConfig Defaults();

  // STATESHIFT_DB_* variables override whatever the file said.
  static void ApplyEnvironment(stateshift::runtime::config::RuntimeConfig& config);

  // Throws util::ConfigurationError. Performs no I/O.
  static void Validate(const stateshift::runtime::config::RuntimeConfig& config);
};

} // namespace stateshift::config
