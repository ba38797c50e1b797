#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace orchestra::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("8080" is not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

orchestra::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  orchestra::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  return config;
}

AssignmentTiming ResolveAssignmentTiming(const orchestra::runtime::config::RuntimeConfig& config) {
  AssignmentTiming timing;
  const auto&      assignment = config.assignment();

  if (assignment.has_reconcile_interval()) {
    const auto interval = util::FromProto(assignment.reconcile_interval());
    if (interval.count() <= 0) {
      throw std::invalid_argument("assignment.reconcile_interval must be positive");
    }
    timing.reconcile_interval = interval;
  }

  timing.error_backoff = timing.reconcile_interval * 10;
  if (assignment.has_error_backoff()) {
    const auto backoff = util::FromProto(assignment.error_backoff());
    if (backoff.count() <= 0) {
      throw std::invalid_argument("assignment.error_backoff must be positive");
    }
    timing.error_backoff = backoff;
  }

  return timing;
}

DiscoverySettings ResolveDiscoverySettings(const orchestra::runtime::config::RuntimeConfig& config) {
  DiscoverySettings settings;
  const auto&       discovery = config.discovery();

  settings.enabled       = discovery.enabled();
  settings.sessions_root = discovery.sessions_root();
  if (settings.enabled && settings.sessions_root.empty()) {
    throw std::invalid_argument("discovery.sessions_root is required when discovery is enabled");
  }

  if (discovery.has_refresh_interval()) {
    settings.refresh_interval = util::FromProto(discovery.refresh_interval());
    if (settings.refresh_interval.count() <= 0) {
      throw std::invalid_argument("discovery.refresh_interval must be positive");
    }
  }
  if (discovery.has_activity_window()) {
    settings.activity_window = util::FromProto(discovery.activity_window());
    if (settings.activity_window.count() <= 0) {
      throw std::invalid_argument("discovery.activity_window must be positive");
    }
  }
  if (!discovery.worker_kind().empty()) {
    settings.worker_kind = discovery.worker_kind();
  }

  return settings;
}

} // namespace orchestra::config
