#pragma once

#include <string>

#include "config/config.pb.h"

namespace edgerun::config {

inline constexpr char kDefaultBindAddress[] = "0.0.0.0:9000";

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected. Load() is what the server uses: file (optional), then environment,
  then defaults, then validation.
*/
class ConfigLoader {
 public:
  static edgerun::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static edgerun::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Empty path means no file: defaults plus environment only.
  static edgerun::runtime::config::RuntimeConfig Load(const std::string& path);

  static void ApplyDefaults(edgerun::runtime::config::RuntimeConfig* config);

  // SIDECAR_PORT replaces the port of server.bind_address.
  static void ApplyEnvironmentOverrides(edgerun::runtime::config::RuntimeConfig* config);

  static void Validate(const edgerun::runtime::config::RuntimeConfig& config);
};

} // namespace edgerun::config
