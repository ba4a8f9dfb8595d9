#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace backupmeta::config {

inline constexpr const char* kDefaultSystemTableName          = "backup:system";
inline constexpr int64_t     kDefaultAvailabilityTimeoutMs    = 60000;
inline constexpr int64_t     kDefaultAvailabilityPollInterval = 100;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected by the proto schema. Missing system_table fields are filled with
  defaults and the result is validated before it is returned.

  session_ttl_seconds == 0 keeps sessions forever.
*/
class ConfigLoader {
 public:
  static backupmeta::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static backupmeta::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Config used when no file is given: memory store, default system table.
  static backupmeta::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(backupmeta::runtime::config::RuntimeConfig& config);
  static void Validate(const backupmeta::runtime::config::RuntimeConfig& config);
};

} // namespace backupmeta::config
