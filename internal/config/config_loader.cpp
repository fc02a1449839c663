#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace blegw::config {

using blegw::util::InvalidConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("001122334455" is a MAC, not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // strtod also takes hex, so manufacturer ids can be written as 0x0499
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
      throw InvalidConfig("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

blegw::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  blegw::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(blegw::runtime::config::RuntimeConfig& config) {
  auto* gateway = config.mutable_gateway();
  if (gateway->rate_limit_interval_sec() == 0) gateway->set_rate_limit_interval_sec(kDefaultRateLimitIntervalSec);
  if (gateway->max_tracked_devices() == 0) gateway->set_max_tracked_devices(kDefaultMaxTrackedDevices);
  if (gateway->cleanup_interval_sec() == 0) gateway->set_cleanup_interval_sec(kDefaultCleanupIntervalSec);
  if (gateway->delivery_timeout_ms() == 0) gateway->set_delivery_timeout_ms(kDefaultDeliveryTimeoutMs);
  if (gateway->http_timeout_sec() == 0) gateway->set_http_timeout_sec(kDefaultHttpTimeoutSec);
  if (gateway->bluetooth_adapter().empty()) gateway->set_bluetooth_adapter(kDefaultBluetoothAdapter);

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }
}

void ConfigLoader::Validate(const blegw::runtime::config::RuntimeConfig& config) {
  const auto& gateway = config.gateway();

  if (gateway.endpoint_url().empty()) {
    throw InvalidConfig("gateway.endpoint_url is required");
  }
  if (gateway.endpoint_url().rfind("http://", 0) != 0) {
    throw InvalidConfig("gateway.endpoint_url must be an http:// URL: " + gateway.endpoint_url());
  }

  for (const auto id : gateway.manufacturer_ids()) {
    if (id > 0xFFFF) {
      throw InvalidConfig("gateway.manufacturer_ids entry does not fit in 16 bits: " + std::to_string(id));
    }
  }
}

} // namespace blegw::config
