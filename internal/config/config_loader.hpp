#pragma once

#include <string>

#include "config/config.pb.h"

namespace roster::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected. Unset tunables get their defaults.
*/
class ConfigLoader {
 public:
  static roster::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset dedup tunables and the default backend.
  static void ApplyDefaults(roster::runtime::config::RuntimeConfig& config);

  // Throws util::ConfigError on an unusable combination.
  static void Validate(const roster::runtime::config::RuntimeConfig& config);
};

inline constexpr const char* kDefaultPlanPath          = "data/dedup-plan.json";
inline constexpr unsigned    kDefaultBatchPauseMs      = 2000;
inline constexpr unsigned    kDefaultDriftThreshold    = 50;
inline constexpr unsigned    kDefaultDeleteChunkSize   = 500;

} // namespace roster::config
