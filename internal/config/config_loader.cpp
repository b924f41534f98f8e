#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace auklet::config {

using auklet::runtime::config::RuntimeConfig;
using auklet::util::ConfigError;

namespace {

constexpr std::string_view kEnvPrefix = "AUKLET_";

constexpr uint32_t kDefaultTimeoutMs      = 10000;
constexpr uint64_t kDefaultMaxRecordBytes = 1024 * 1024;

} // namespace

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
      throw ConfigError("Unsupported YAML node");
  }
}

static std::optional<std::string> Env(std::string_view key) {
  const std::string name = std::string(kEnvPrefix) + std::string(key);
  const char*       value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

static std::vector<std::string> SplitEndpoints(const std::string& list) {
  std::vector<std::string> endpoints;
  std::stringstream        in(list);
  std::string              item;
  while (std::getline(in, item, ',')) {
    const auto first = item.find_first_not_of(" \t");
    if (first == std::string::npos) {
      continue;
    }
    const auto last = item.find_last_not_of(" \t");
    endpoints.push_back(item.substr(first, last - first + 1));
  }
  return endpoints;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::Load(const std::optional<std::string>& yaml_path) {
  RuntimeConfig config;
  if (yaml_path) {
    config = LoadFromYaml(*yaml_path);
  }
  ApplyEnvironment(&config);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig* config) {
  if (auto v = Env("BASE_URL")) {
    config->mutable_integrity()->set_base_url(*v);
  }
  if (auto v = Env("BROKERS")) {
    auto* endpoints = config->mutable_broker()->mutable_endpoints();
    endpoints->Clear();
    for (auto& endpoint : SplitEndpoints(*v)) {
      endpoints->Add(std::move(endpoint));
    }
  }
  if (auto v = Env("PROF_TOPIC")) {
    config->mutable_topics()->set_profile(*v);
  }
  if (auto v = Env("EVENT_TOPIC")) {
    config->mutable_topics()->set_event(*v);
  }
  if (auto v = Env("CA")) {
    config->mutable_broker()->mutable_tls()->set_ca(*v);
  }
  if (auto v = Env("CERT")) {
    config->mutable_broker()->mutable_tls()->set_cert(*v);
  }
  if (auto v = Env("PRIVATE_KEY")) {
    config->mutable_broker()->mutable_tls()->set_private_key(*v);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  if (config->integrity().timeout_ms() == 0) {
    config->mutable_integrity()->set_timeout_ms(kDefaultTimeoutMs);
  }

  auto* broker = config->mutable_broker();
  if (broker->client_id().empty()) {
    broker->set_client_id("auklet-wrap");
  }
  if (broker->connect_timeout_ms() == 0) {
    broker->set_connect_timeout_ms(kDefaultTimeoutMs);
  }
  if (broker->send_timeout_ms() == 0) {
    broker->set_send_timeout_ms(kDefaultTimeoutMs);
  }

  if (config->ipc().max_record_bytes() == 0) {
    config->mutable_ipc()->set_max_record_bytes(kDefaultMaxRecordBytes);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::vector<std::string_view> missing;
  if (config.integrity().base_url().empty()) missing.push_back("BASE_URL");
  if (config.broker().endpoints().empty()) missing.push_back("BROKERS");
  if (config.topics().profile().empty()) missing.push_back("PROF_TOPIC");
  if (config.topics().event().empty()) missing.push_back("EVENT_TOPIC");
  if (config.broker().tls().ca().empty()) missing.push_back("CA");
  if (config.broker().tls().cert().empty()) missing.push_back("CERT");
  if (config.broker().tls().private_key().empty()) missing.push_back("PRIVATE_KEY");

  if (missing.empty()) {
    return;
  }

  std::ostringstream msg;
  msg << "incomplete configuration, missing:";
  for (const auto& key : missing) {
    const std::string name = std::string(kEnvPrefix) + std::string(key);
    AUKLET_LOG_ERROR("missing required configuration", {observability::StringField("variable", name)});
    msg << ' ' << name;
  }
  throw ConfigError(msg.str());
}

} // namespace auklet::config
