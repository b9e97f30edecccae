#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace edgesync::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

edgesync::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  edgesync::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(edgesync::runtime::config::RuntimeConfig& config) {
  using edgesync::runtime::config::PAYLOAD_COMPRESSION_UNSPECIFIED;
  using edgesync::runtime::config::PAYLOAD_COMPRESSION_ZSTD;

  auto* storage = config.mutable_storage();
  if (storage->quota_bytes() == 0) storage->set_quota_bytes(kDefaultQuotaBytes);
  if (storage->compression() == PAYLOAD_COMPRESSION_UNSPECIFIED) storage->set_compression(PAYLOAD_COMPRESSION_ZSTD);

  auto* gateway = config.mutable_gateway();
  if (gateway->ack_timeout_ms() == 0) gateway->set_ack_timeout_ms(kDefaultAckTimeoutMs);
  if (gateway->connect_timeout_ms() == 0) gateway->set_connect_timeout_ms(kDefaultConnectTimeoutMs);

  auto* sync = config.mutable_sync();
  if (sync->tick_interval_ms() == 0) sync->set_tick_interval_ms(kDefaultTickIntervalMs);
  if (sync->degraded_budget() == 0) sync->set_degraded_budget(kDefaultDegradedBudget);
  if (sync->persistent_failure_threshold() == 0) sync->set_persistent_failure_threshold(kDefaultPersistentFailures);
  if (sync->eviction_interval_ms() == 0) sync->set_eviction_interval_ms(kDefaultEvictionIntervalMs);
  if (sync->downlink_interval_ms() == 0) sync->set_downlink_interval_ms(kDefaultDownlinkIntervalMs);
  if (sync->downlink_batch() == 0) sync->set_downlink_batch(kDefaultDownlinkBatch);

  auto* connection = config.mutable_connection();
  if (connection->backoff_base_ms() == 0) connection->set_backoff_base_ms(kDefaultBackoffBaseMs);
  if (connection->backoff_cap_ms() == 0) connection->set_backoff_cap_ms(kDefaultBackoffCapMs);
  if (connection->jitter_ratio() <= 0.0) connection->set_jitter_ratio(kDefaultJitterRatio);
  if (connection->auth_failure_alert_threshold() == 0) connection->set_auth_failure_alert_threshold(kDefaultAuthAlertThreshold);
  if (connection->quality_window() == 0) connection->set_quality_window(kDefaultQualityWindow);
  if (connection->degraded_failure_rate() <= 0.0) connection->set_degraded_failure_rate(kDefaultDegradedFailureRate);
  if (connection->degraded_latency_ms() == 0) connection->set_degraded_latency_ms(kDefaultDegradedLatencyMs);
  if (connection->recovery_quality() <= 0.0) connection->set_recovery_quality(kDefaultRecoveryQuality);

  if (config.ingest().capacity() == 0) config.mutable_ingest()->set_capacity(kDefaultIngestCapacity);
  if (config.clock().drift_threshold_ms() == 0) config.mutable_clock()->set_drift_threshold_ms(kDefaultDriftThresholdMs);

  if (config.database().backend_case() == edgesync::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
}

} // namespace edgesync::config
