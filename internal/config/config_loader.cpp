#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <cstdint>
#include <string>
#include <stdexcept>

namespace edgerun::config {

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
  if (endptr && *endptr == '\0') {
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

namespace {

edgerun::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  edgerun::runtime::config::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
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

  return config;
}

uint32_t ParsePort(const std::string& text, const std::string& source) {
  char*      endptr = nullptr;
  const long port   = std::strtol(text.c_str(), &endptr, 10);
  if (text.empty() || !endptr || *endptr != '\0' || port <= 0 || port > 65535) {
    throw std::runtime_error("Invalid configuration: " + source + " is not a valid port: '" + text + "'");
  }
  return static_cast<uint32_t>(port);
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

edgerun::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

edgerun::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

edgerun::runtime::config::RuntimeConfig ConfigLoader::Load(const std::string& path) {
  auto config = path.empty() ? edgerun::runtime::config::RuntimeConfig{} : LoadFromYaml(path);
  ApplyEnvironmentOverrides(&config);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(edgerun::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);

  auto* overlay = config->mutable_overlay();
  if (overlay->hostname().empty()) overlay->set_hostname("ts-sidecar");
  if (overlay->auth_key_env().empty()) overlay->set_auth_key_env("TS_AUTHKEY");
  if (overlay->tailscale_binary().empty()) overlay->set_tailscale_binary("tailscale");
  if (overlay->init_timeout_ms() == 0) overlay->set_init_timeout_ms(30'000);

  auto* executor = config->mutable_executor();
  if (executor->remote_user().empty()) executor->set_remote_user("root");
  if (executor->ssh_binary().empty()) executor->set_ssh_binary("ssh");
  if (executor->ssh_port() == 0) executor->set_ssh_port(22);
  if (executor->probe_timeout_ms() == 0) executor->set_probe_timeout_ms(20'000);
  if (executor->execution_deadline_ms() == 0) executor->set_execution_deadline_ms(60'000);
  if (executor->connect_timeout_s() == 0) executor->set_connect_timeout_s(25);
  if (executor->server_alive_interval_s() == 0) executor->set_server_alive_interval_s(10);
  if (executor->policy_denial_pattern().empty()) executor->set_policy_denial_pattern("policy does not permit");

  auto* deploy = config->mutable_deploy();
  if (deploy->restart_policy().empty()) deploy->set_restart_policy("unless-stopped");
}

void ConfigLoader::ApplyEnvironmentOverrides(edgerun::runtime::config::RuntimeConfig* config) {
  const char* port_env = std::getenv("SIDECAR_PORT");
  if (!port_env || !*port_env) {
    return;
  }

  const auto port = ParsePort(port_env, "SIDECAR_PORT");

  std::string host = "0.0.0.0";
  const auto& bind = config->server().bind_address();
  if (const auto colon = bind.rfind(':'); colon != std::string::npos && colon > 0) {
    host = bind.substr(0, colon);
  }
  config->mutable_server()->set_bind_address(host + ":" + std::to_string(port));
}

void ConfigLoader::Validate(const edgerun::runtime::config::RuntimeConfig& config) {
  const auto& executor = config.executor();
  if (executor.ssh_port() == 0 || executor.ssh_port() > 65535) {
    throw std::runtime_error("Invalid configuration: executor.ssh_port out of range");
  }
  if (executor.probe_timeout_ms() > executor.execution_deadline_ms()) {
    throw std::runtime_error("Invalid configuration: executor.probe_timeout_ms exceeds execution_deadline_ms");
  }

  const auto& policy = config.deploy().restart_policy();
  if (policy != "unless-stopped" && policy != "always") {
    throw std::runtime_error("Invalid configuration: deploy.restart_policy must be 'unless-stopped' or 'always', got '" + policy + "'");
  }
}

} // namespace edgerun::config
