#pragma once

#include <string>

#include "config/config.pb.h"

namespace blegw::config {

inline constexpr unsigned kDefaultRateLimitIntervalSec = 5;
inline constexpr unsigned kDefaultMaxTrackedDevices    = 50;
inline constexpr unsigned kDefaultCleanupIntervalSec   = 300;
inline constexpr unsigned kDefaultDeliveryTimeoutMs    = 10000;
inline constexpr unsigned kDefaultHttpTimeoutSec       = 5;
inline constexpr char     kDefaultBluetoothAdapter[]   = "hci0";
inline constexpr char     kDefaultBindAddress[]        = "0.0.0.0:50071";

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, unset pipeline settings get their defaults, and the result is
  validated. Every failure is reported as util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static blegw::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(blegw::runtime::config::RuntimeConfig& config);
  static void Validate(const blegw::runtime::config::RuntimeConfig& config);
};

} // namespace blegw::config
