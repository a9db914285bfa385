#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"

namespace claimctl::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static claimctl::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  /*
    Picks the config file to read:
      explicit path → $CLAIMCTL_CONFIG → $HOME/.claimctl/config.yaml (if present)

    Returns nullopt when none applies; callers then use defaults.
  */
  static std::optional<std::string> ResolvePath(const std::string& explicit_path);

  // ResolvePath() + LoadFromYaml(), or a default RuntimeConfig.
  static claimctl::runtime::config::RuntimeConfig Load(const std::string& explicit_path);
};

} // namespace claimctl::config
