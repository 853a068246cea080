#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace install::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Empty or zero fields are replaced by the defaults below.
*/
class ConfigLoader {
 public:
  static install::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static install::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(install::runtime::config::RuntimeConfig* config);
};

inline constexpr char     kDefaultCacheRoot[]      = "/var/cache/install-manager";
inline constexpr char     kDefaultInstallRoot[]    = "/var/lib/install-manager/packages";
inline constexpr char     kDefaultSpoolRoot[]      = "/var/spool/install-manager";
inline constexpr char     kDefaultInstallerName[]  = "install-manager";
inline constexpr uint32_t kDefaultDownloadWorkers  = 2;
inline constexpr uint64_t kDefaultChunkSizeBytes   = 256 * 1024;
inline constexpr uint64_t kDefaultPollIntervalMs   = 500;

} // namespace install::config
