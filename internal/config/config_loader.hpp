#pragma once

#include <string>

#include "config/config.pb.h"

namespace edgesync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled from the defaults below after parsing.
*/
class ConfigLoader {
 public:
  static edgesync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(edgesync::runtime::config::RuntimeConfig& config);
};

inline constexpr uint64_t kDefaultQuotaBytes              = 5ULL * 1024 * 1024 * 1024;
inline constexpr uint64_t kDefaultTickIntervalMs          = 1000;
inline constexpr uint32_t kDefaultDegradedBudget          = 10;
inline constexpr uint32_t kDefaultPersistentFailures      = 10;
inline constexpr uint64_t kDefaultAckTimeoutMs            = 5000;
inline constexpr uint64_t kDefaultConnectTimeoutMs        = 10000;
inline constexpr uint64_t kDefaultEvictionIntervalMs      = 60000;
inline constexpr uint64_t kDefaultDownlinkIntervalMs      = 30000;
inline constexpr uint32_t kDefaultDownlinkBatch           = 32;
inline constexpr uint64_t kDefaultBackoffBaseMs           = 1000;
inline constexpr uint64_t kDefaultBackoffCapMs            = 60000;
inline constexpr double   kDefaultJitterRatio             = 0.2;
inline constexpr uint32_t kDefaultAuthAlertThreshold      = 5;
inline constexpr uint32_t kDefaultQualityWindow           = 20;
inline constexpr double   kDefaultDegradedFailureRate     = 0.3;
inline constexpr uint64_t kDefaultDegradedLatencyMs       = 2000;
inline constexpr double   kDefaultRecoveryQuality         = 0.8;
inline constexpr uint32_t kDefaultIngestCapacity          = 1024;
inline constexpr uint64_t kDefaultDriftThresholdMs        = 5000;

} // namespace edgesync::config
