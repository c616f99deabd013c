#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace roster::config {

using roster::runtime::config::RuntimeConfig;

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
      throw util::ConfigError("unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty document means "all defaults"
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw util::ConfigError("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw util::ConfigError("invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (database->backend().empty()) {
    database->set_backend("sqlite");
  }
  if (database->backend() == "sqlite" && database->sqlite().path().empty()) {
    database->mutable_sqlite()->set_path("roster.db");
    database->mutable_sqlite()->set_wal_mode(true);
  }

  auto* dedup = config.mutable_dedup();
  if (dedup->plan_path().empty()) {
    dedup->set_plan_path(kDefaultPlanPath);
  }
  if (!dedup->has_batch_pause_ms()) {
    dedup->set_batch_pause_ms(kDefaultBatchPauseMs);
  }
  if (!dedup->has_drift_warning_threshold()) {
    dedup->set_drift_warning_threshold(kDefaultDriftThreshold);
  }
  if (!dedup->has_delete_chunk_size()) {
    dedup->set_delete_chunk_size(kDefaultDeleteChunkSize);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& backend = config.database().backend();
  if (backend != "memory" && backend != "sqlite" && backend != "postgres") {
    throw util::ConfigError("unknown database backend: " + backend);
  }
  if (backend == "sqlite" && config.database().sqlite().path().empty()) {
    throw util::ConfigError("database.sqlite.path is required for the sqlite backend");
  }
  if (backend == "postgres" && config.database().postgres().conninfo().empty()) {
    throw util::ConfigError("database.postgres.conninfo is required for the postgres backend");
  }
  if (config.dedup().delete_chunk_size() == 0) {
    throw util::ConfigError("dedup.delete_chunk_size must be positive");
  }
}

} // namespace roster::config
