#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace framecomp::config {

using framecomp::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars are always strings
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
    case YAML::NodeType::Undefined:
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
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsDefined() && !yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw util::ConfigurationError("Invalid configuration: top level must be a mapping");
    }

    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw util::ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw util::ConfigurationError("Invalid configuration: " + std::string(status.message()));
    }
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
    throw util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");
  if (server->max_message_bytes() == 0) server->set_max_message_bytes(64ull * 1024 * 1024);

  auto* fetch = config.mutable_fetch();
  if (fetch->timeout_ms() == 0) fetch->set_timeout_ms(10000);
  if (fetch->max_feed_bytes() == 0) fetch->set_max_feed_bytes(50ull * 1024 * 1024);
  if (fetch->max_image_bytes() == 0) fetch->set_max_image_bytes(10ull * 1024 * 1024);
  if (fetch->allowed_ports_size() == 0) {
    fetch->add_allowed_ports(80);
    fetch->add_allowed_ports(443);
  }
  if (fetch->max_redirects() == 0) fetch->set_max_redirects(3);
  if (fetch->user_agent().empty()) fetch->set_user_agent("frame-compositor/0.1");

  auto* compositor = config.mutable_compositor();
  if (compositor->output_quality() == 0) compositor->set_output_quality(85);
  if (compositor->min_source_dimension() == 0) compositor->set_min_source_dimension(10);
  if (compositor->max_source_dimension() == 0) compositor->set_max_source_dimension(4000);
  if (compositor->max_template_bytes() == 0) compositor->set_max_template_bytes(10ull * 1024 * 1024);
  if (compositor->max_template_dimension() == 0) compositor->set_max_template_dimension(8000);

  auto* preview = config.mutable_preview();
  if (preview->max_width() == 0) preview->set_max_width(800);
  if (preview->max_height() == 0) preview->set_max_height(600);
  if (preview->quality() == 0) preview->set_quality(75);

  auto* bulk = config.mutable_bulk();
  if (bulk->max_in_flight() == 0) bulk->set_max_in_flight(16);
  if (bulk->run_workers() == 0) bulk->set_run_workers(2);
  if (bulk->progress_interval() == 0) bulk->set_progress_interval(10);

  if (config.database().backend_case() == framecomp::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_postgres() && config.database().postgres().pool_size() == 0) {
    config.mutable_database()->mutable_postgres()->set_pool_size(4);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& compositor = config.compositor();
  if (compositor.output_quality() > 100) {
    throw util::ConfigurationError("compositor.output_quality must be within 1..100");
  }
  if (compositor.min_source_dimension() > compositor.max_source_dimension()) {
    throw util::ConfigurationError("compositor.min_source_dimension exceeds max_source_dimension");
  }
  if (config.preview().quality() > 100) {
    throw util::ConfigurationError("preview.quality must be within 1..100");
  }
  for (auto port : config.fetch().allowed_ports()) {
    if (port == 0 || port > 65535) {
      throw util::ConfigurationError("fetch.allowed_ports contains invalid port " + std::to_string(port));
    }
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::ConfigurationError("database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw util::ConfigurationError("database.postgres.connection_uri is required");
  }
  if (config.storage().has_object() && config.storage().object().uri().empty()) {
    throw util::ConfigurationError("storage.object.uri is required");
  }
}

} // namespace framecomp::config
