#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace seat::config {

namespace {

using seat::runtime::config::RuntimeConfig;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("600s", "10")
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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

std::chrono::seconds ToSeconds(const google::protobuf::Duration& duration) {
  return std::chrono::seconds(duration.seconds());
}

void ValidateTtl(const google::protobuf::Duration& duration, const std::string& field) {
  if (duration.seconds() <= 0 || duration.nanos() != 0 || duration.seconds() % 60 != 0) {
    throw std::runtime_error("Invalid configuration: " + field + " must be a positive whole number of minutes");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& reservations = config.reservations();
  if (reservations.has_default_hold_ttl()) {
    ValidateTtl(reservations.default_hold_ttl(), "reservations.default_hold_ttl");
  }
  if (reservations.has_max_hold_ttl()) {
    ValidateTtl(reservations.max_hold_ttl(), "reservations.max_hold_ttl");
    if (DefaultHoldTtl(config) > *MaxHoldTtl(config)) {
      throw std::runtime_error("Invalid configuration: reservations.default_hold_ttl exceeds reservations.max_hold_ttl");
    }
  }

  const auto& store = config.store();
  if (store.has_json_file() && store.json_file().path().empty()) {
    throw std::runtime_error("Invalid configuration: store.json_file.path is empty");
  }
  if (store.has_sqlite() && store.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: store.sqlite.path is empty");
  }
}

std::chrono::minutes DefaultHoldTtl(const RuntimeConfig& config) {
  if (!config.reservations().has_default_hold_ttl()) {
    return kDefaultHoldTtl;
  }
  return std::chrono::duration_cast<std::chrono::minutes>(ToSeconds(config.reservations().default_hold_ttl()));
}

std::optional<std::chrono::minutes> MaxHoldTtl(const RuntimeConfig& config) {
  if (!config.reservations().has_max_hold_ttl()) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::minutes>(ToSeconds(config.reservations().max_hold_ttl()));
}

bool SeedDefaultFlights(const RuntimeConfig& config) {
  return !config.reservations().has_seed_default_flights() || config.reservations().seed_default_flights();
}

} // namespace seat::config
