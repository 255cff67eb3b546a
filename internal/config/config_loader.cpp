#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace crumbtrail::config {

using crumbtrail::util::ConfigError;

namespace {

constexpr uint32_t kDefaultTimeoutMs          = 10'000;
constexpr uint32_t kDefaultMaxBatchSize       = 100;
constexpr uint32_t kDefaultUploadIntervalSec  = 60;
constexpr uint32_t kDefaultBreadcrumbCapacity = 50;
constexpr char     kDefaultStorageRoot[]      = "/tmp/crumbtrail";

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
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
      throw ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(crumbtrail::runtime::config::RuntimeConfig* config) {
  if (const char* base_url = std::getenv("CRUMBTRAIL_BASE_URL")) {
    config->mutable_collector()->set_base_url(base_url);
  }
  if (const char* api_key = std::getenv("CRUMBTRAIL_API_KEY")) {
    config->mutable_collector()->set_api_key(api_key);
  }

  if (config->collector().base_url().empty()) {
    throw ConfigError("Invalid configuration: collector.base_url is required");
  }

  if (config->collector().timeout_ms() == 0) {
    config->mutable_collector()->set_timeout_ms(kDefaultTimeoutMs);
  }
  if (config->storage().root_path().empty()) {
    config->mutable_storage()->set_root_path(kDefaultStorageRoot);
  }
  if (config->upload().max_batch_size() == 0) {
    config->mutable_upload()->set_max_batch_size(kDefaultMaxBatchSize);
  }
  if (config->upload().interval_sec() == 0) {
    config->mutable_upload()->set_interval_sec(kDefaultUploadIntervalSec);
  }
  if (!config->upload().has_delete_corrupted()) {
    config->mutable_upload()->set_delete_corrupted(true);
  }
  if (config->breadcrumbs().capacity() == 0) {
    config->mutable_breadcrumbs()->set_capacity(kDefaultBreadcrumbCapacity);
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

crumbtrail::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  crumbtrail::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

} // namespace crumbtrail::config
