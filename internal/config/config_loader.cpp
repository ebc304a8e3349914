#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace trailwatch::config {

namespace {

constexpr uint64_t kDefaultMoveThresholdMs       = 100;
constexpr uint64_t kDefaultRestoreTimeLimitMs    = 5 * 60 * 1000;
constexpr uint64_t kDefaultClassificationDelayMs = 50;
constexpr uint32_t kDefaultBatchSize             = 10;
constexpr uint64_t kDefaultBatchPauseMs          = 10;
constexpr uint32_t kDefaultReconcileWindow       = 1000;
constexpr uint32_t kDefaultBusyTimeoutMs         = 5000;
constexpr uint32_t kDefaultMaxDepth              = 10;

const char* const kDefaultDatabasePath = ".trailwatch/data/activity.db";

const char* const kDefaultExcludePatterns[] = {
    "**/node_modules/**", "**/.git/**", "**/.*", "**/.trailwatch/**", "**/dist/**", "**/coverage/**", "**/build/**", "**/*.log",
};

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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

trailwatch::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  trailwatch::runtime::config::RuntimeConfig config;

  // an empty document is a valid "all defaults" config
  if (!yaml.IsNull()) {
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
  }

  ApplyDefaults(config);
  return config;
}

trailwatch::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  trailwatch::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(trailwatch::runtime::config::RuntimeConfig& config) {
  auto* monitoring = config.mutable_monitoring();
  if (monitoring->watch_paths().empty()) {
    monitoring->add_watch_paths(".");
  }
  if (monitoring->exclude_patterns().empty()) {
    for (const char* pattern : kDefaultExcludePatterns) {
      monitoring->add_exclude_patterns(pattern);
    }
  }
  if (monitoring->max_depth() == 0) {
    monitoring->set_max_depth(kDefaultMaxDepth);
  }

  auto* classifier = config.mutable_classifier();
  if (classifier->move_threshold_ms() == 0) classifier->set_move_threshold_ms(kDefaultMoveThresholdMs);
  if (classifier->restore_time_limit_ms() == 0) classifier->set_restore_time_limit_ms(kDefaultRestoreTimeLimitMs);
  if (classifier->classification_delay_ms() == 0) classifier->set_classification_delay_ms(kDefaultClassificationDelayMs);

  auto* scan = config.mutable_scan();
  if (scan->batch_size() == 0) scan->set_batch_size(kDefaultBatchSize);
  if (scan->batch_pause_ms() == 0) scan->set_batch_pause_ms(kDefaultBatchPauseMs);
  if (scan->reconcile_window() == 0) scan->set_reconcile_window(kDefaultReconcileWindow);

  auto* sqlite = config.mutable_database()->mutable_sqlite();
  if (sqlite->path().empty()) sqlite->set_path(kDefaultDatabasePath);
  if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  if (!sqlite->has_wal_mode()) sqlite->set_wal_mode(true);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  // The classification delay must leave room for the disappearance window,
  // otherwise every move would lose the race against its own expiry.
  if (classifier->classification_delay_ms() >= classifier->move_threshold_ms()) {
    throw util::InvalidConfig("classifier.classification_delay_ms must be smaller than classifier.move_threshold_ms");
  }

  for (const auto& watch_path : monitoring->watch_paths()) {
    if (watch_path.empty()) {
      throw util::InvalidConfig("monitoring.watch_paths must not contain empty entries");
    }
  }
}

} // namespace trailwatch::config
