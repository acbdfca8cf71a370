#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace ledgersync::config {

using ledgersync::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultWorkerThreads       = 2;
constexpr int64_t  kDefaultSyncIntervalSeconds = 300;
constexpr uint32_t kDefaultCategoryRetention   = 30;
constexpr uint32_t kDefaultRetention           = 90;
constexpr uint32_t kDefaultMaxOccurrences      = 100;
constexpr uint32_t kMaxWorkerThreads           = 64;
constexpr int32_t  kMaxUtcOffsetMinutes        = 14 * 60;

void DefaultDays(uint32_t value, uint32_t fallback, void (ledgersync::runtime::config::RetentionConfig::*setter)(uint32_t),
                 ledgersync::runtime::config::RetentionConfig* retention) {
  if (value == 0) {
    (retention->*setter)(fallback);
  }
}

[[noreturn]] void Invalid(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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
      throw std::runtime_error("Unsupported YAML node");
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
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty document means "all defaults"
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
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (database->backend_case() == ledgersync::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }

  auto* remote = config.mutable_remote();
  if (remote->backend_case() == ledgersync::runtime::config::RemoteConfig::BACKEND_NOT_SET) {
    remote->mutable_memory();
  }

  auto* sync = config.mutable_sync();
  if (sync->worker_threads() == 0) {
    sync->set_worker_threads(kDefaultWorkerThreads);
  }
  if (!sync->has_interval()) {
    sync->mutable_interval()->set_seconds(kDefaultSyncIntervalSeconds);
  }

  using Retention = ledgersync::runtime::config::RetentionConfig;
  auto* retention = config.mutable_retention();
  DefaultDays(retention->categories_days(), kDefaultCategoryRetention, &Retention::set_categories_days, retention);
  DefaultDays(retention->budgets_days(), kDefaultRetention, &Retention::set_budgets_days, retention);
  DefaultDays(retention->incomes_days(), kDefaultRetention, &Retention::set_incomes_days, retention);
  DefaultDays(retention->recurring_expenses_days(), kDefaultRetention, &Retention::set_recurring_expenses_days, retention);
  DefaultDays(retention->recurring_incomes_days(), kDefaultRetention, &Retention::set_recurring_incomes_days, retention);
  DefaultDays(retention->expenses_days(), kDefaultRetention, &Retention::set_expenses_days, retention);

  auto* recurrence = config.mutable_recurrence();
  if (recurrence->max_occurrences_per_rule() == 0) {
    recurrence->set_max_occurrences_per_rule(kDefaultMaxOccurrences);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  static const std::set<std::string> kLevels = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
  if (!config.logging().level().empty() && !kLevels.contains(config.logging().level())) {
    Invalid("logging.level '" + config.logging().level() + "' is not a log level");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    Invalid("database.sqlite.path must not be empty");
  }

  if (config.remote().has_directory() && config.remote().directory().path().empty()) {
    Invalid("remote.directory.path must not be empty");
  }

  if (config.sync().worker_threads() > kMaxWorkerThreads) {
    Invalid("sync.worker_threads must be at most " + std::to_string(kMaxWorkerThreads));
  }
  if (config.sync().interval().seconds() <= 0) {
    Invalid("sync.interval must be positive");
  }

  const auto offset = config.recurrence().utc_offset_minutes();
  if (offset < -kMaxUtcOffsetMinutes || offset > kMaxUtcOffsetMinutes) {
    Invalid("recurrence.utc_offset_minutes must be within +/-14h");
  }
}

} // namespace ledgersync::config
