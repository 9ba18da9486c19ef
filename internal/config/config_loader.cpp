#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace meshgraph::config {

using meshgraph::runtime::config::RuntimeConfig;
using util::ConfigurationError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1234" as a password)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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
      throw ConfigurationError("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // empty document means all defaults
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw ConfigurationError("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* broker = config.mutable_broker();
  if (broker->address().empty()) broker->set_address("localhost");
  if (broker->port() == 0) broker->set_port(broker->tls() ? 8883 : 1883);
  if (broker->topic().empty()) broker->set_topic("msh/#");
  if (broker->client_id().empty()) broker->set_client_id("meshgraph-collector");
  if (broker->keepalive().empty()) broker->set_keepalive("60s");
  if (broker->default_channel_key().empty()) broker->set_default_channel_key("AQ==");

  auto* reconnect = config.mutable_reconnect();
  if (reconnect->min_delay().empty()) reconnect->set_min_delay("1s");
  if (reconnect->max_delay().empty()) reconnect->set_max_delay("60s");
  if (reconnect->stable_after().empty()) reconnect->set_stable_after("30s");

  auto* database = config.mutable_database();
  if (database->path().empty()) database->set_path("mqtt_messages.db");
  if (!database->has_write_retries()) database->set_write_retries(3);
  if (database->retry_backoff().empty()) database->set_retry_backoff("50ms");

  auto* ingest = config.mutable_ingest();
  if (!ingest->has_workers()) ingest->set_workers(2);
  if (ingest->queue_capacity() == 0) ingest->set_queue_capacity(10000);
  if (!ingest->has_handoff_retries()) ingest->set_handoff_retries(3);
  if (ingest->stats_interval().empty()) ingest->set_stats_interval("60s");

  auto* exp = config.mutable_export_();
  if (exp->output_dir().empty()) exp->set_output_dir("data");
  if (exp->windows_size() == 0) {
    for (const char* w : {"15min", "30min", "1h", "3h", "24h"}) exp->add_windows(w);
  }
  if (exp->series_days_size() == 0) {
    for (uint32_t d : {1u, 7u, 14u, 30u}) exp->add_series_days(d);
  }
  if (exp->rssi_policy().empty()) exp->set_rssi_policy("latest");
}

static void RequireDuration(const std::string& field, const std::string& value) {
  try {
    if (util::ParseDuration(value).count() <= 0) {
      throw ConfigurationError(field + " must be positive: " + value);
    }
  } catch (const std::invalid_argument& e) {
    throw ConfigurationError(field + ": " + e.what());
  }
}

static void RequireChannelKey(const std::string& field, const std::string& psk) {
  auto raw = util::DecodeBase64(psk);
  if (!raw) {
    throw ConfigurationError(field + " is not valid base64");
  }
  if (raw->size() > 32) {
    throw ConfigurationError(field + " is longer than 32 bytes");
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.broker().port() > 65535) {
    throw ConfigurationError("broker.port out of range: " + std::to_string(config.broker().port()));
  }
  RequireDuration("broker.keepalive", config.broker().keepalive());
  RequireChannelKey("broker.default_channel_key", config.broker().default_channel_key());
  for (const auto& [channel, psk] : config.broker().channel_keys()) {
    RequireChannelKey("broker.channel_keys." + channel, psk);
  }
  RequireDuration("reconnect.min_delay", config.reconnect().min_delay());
  RequireDuration("reconnect.max_delay", config.reconnect().max_delay());
  RequireDuration("reconnect.stable_after", config.reconnect().stable_after());
  if (util::ParseDuration(config.reconnect().min_delay()) > util::ParseDuration(config.reconnect().max_delay())) {
    throw ConfigurationError("reconnect.min_delay exceeds reconnect.max_delay");
  }

  RequireDuration("database.retry_backoff", config.database().retry_backoff());
  RequireDuration("ingest.stats_interval", config.ingest().stats_interval());

  for (const auto& window : config.export_().windows()) {
    RequireDuration("export.windows", window);
  }
  for (auto days : config.export_().series_days()) {
    if (days == 0) {
      throw ConfigurationError("export.series_days entries must be positive");
    }
  }

  const auto& policy = config.export_().rssi_policy();
  if (policy != "latest" && policy != "mean") {
    throw ConfigurationError("export.rssi_policy must be latest or mean: " + policy);
  }
}

} // namespace meshgraph::config
