#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledgersync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected; unset fields receive defaults, then the result is validated.
*/
class ConfigLoader {
 public:
  static ledgersync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // In-memory database and remote, default retention and sync settings.
  static ledgersync::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(ledgersync::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error("Invalid configuration: ...").
  static void Validate(const ledgersync::runtime::config::RuntimeConfig& config);
};

} // namespace ledgersync::config
