#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>

#include "internal/jobs/queue.hpp"
#include "internal/util/errors.hpp"

namespace buildq::config {

using buildq::runtime::config::RuntimeConfig;

namespace {

constexpr int         kDefaultWorkers           = 2;
constexpr int         kDefaultCapacity          = 100;
constexpr std::int64_t kDefaultJobTimeoutSeconds = 30 * 60;
constexpr int         kDefaultEstimatedLogLines = 500;
constexpr const char* kDefaultLogDir            = "/tmp/buildq/logs";
constexpr const char* kDefaultDockerBinary      = "docker";
constexpr const char* kDefaultGitBinary         = "git";
constexpr const char* kDefaultPlatform          = "linux/amd64";
constexpr const char* kDefaultServiceName       = "buildq";
constexpr int         kDefaultExportIntervalMs  = 1000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars stay strings ("1.0" for a tag must not become a number).
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
      throw util::InvalidArgument("unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // An empty document means "all defaults".
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    ConfigLoader::Validate(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
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
    throw util::InvalidArgument("failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* queue = config.mutable_queue();
  if (queue->workers() == 0) queue->set_workers(kDefaultWorkers);
  if (queue->capacity() == 0) queue->set_capacity(kDefaultCapacity);
  if (queue->job_timeout_seconds() == 0) queue->set_job_timeout_seconds(kDefaultJobTimeoutSeconds);

  auto* builds = config.mutable_builds();
  if (builds->log_dir().empty()) builds->set_log_dir(kDefaultLogDir);
  if (builds->estimated_log_lines() == 0) builds->set_estimated_log_lines(kDefaultEstimatedLogLines);

  if (!config.database().has_sqlite() && !config.database().has_memory()) {
    config.mutable_database()->mutable_memory();
  }

  auto* runtime = config.mutable_runtime();
  if (runtime->docker_binary().empty()) runtime->set_docker_binary(kDefaultDockerBinary);
  if (runtime->git_binary().empty()) runtime->set_git_binary(kDefaultGitBinary);
  if (runtime->platform().empty()) runtime->set_platform(kDefaultPlatform);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name(kDefaultServiceName);
  if (observability->export_interval_ms() == 0) observability->set_export_interval_ms(kDefaultExportIntervalMs);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& queue = config.queue();
  if (queue.workers() < 1) {
    throw util::InvalidArgument("queue.workers must be >= 1");
  }
  if (queue.capacity() < 1) {
    throw util::InvalidArgument("queue.capacity must be >= 1");
  }
  if (queue.job_timeout_seconds() < 1) {
    throw util::InvalidArgument("queue.job_timeout_seconds must be >= 1");
  }
  if (queue.job_timeout_seconds() > jobs::kMaxJobTimeout.count()) {
    throw util::InvalidArgument("queue.job_timeout_seconds must be <= " + std::to_string(jobs::kMaxJobTimeout.count()));
  }

  const auto& builds = config.builds();
  if (builds.log_dir().empty()) {
    throw util::InvalidArgument("builds.log_dir must not be empty");
  }
  if (builds.estimated_log_lines() < 0) {
    throw util::InvalidArgument("builds.estimated_log_lines must be >= 0");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::InvalidArgument("database.sqlite.path must not be empty");
  }

  if (config.observability().export_interval_ms() < 0) {
    throw util::InvalidArgument("observability.export_interval_ms must be >= 0");
  }
}

} // namespace buildq::config
