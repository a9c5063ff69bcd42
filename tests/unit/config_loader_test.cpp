#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using edgerun::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "edgerun_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsRuntimeError(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
overlay:
  hostname: edge-gw
  auth_key_env: EDGE_KEY
  socket_path: "/run/ts.sock"
executor:
  remote_user: ops
  ssh_port: 2222
  probe_timeout_ms: 5000
  execution_deadline_ms: 30000
  policy_denial_pattern: "denied by acl"
deploy:
  restart_policy: always
)");

  ::unsetenv("SIDECAR_PORT");
  auto config = ConfigLoader::Load(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.overlay().hostname() == "edge-gw");
  assert(config.overlay().auth_key_env() == "EDGE_KEY");
  assert(config.overlay().socket_path() == "/run/ts.sock");
  assert(config.executor().remote_user() == "ops");
  assert(config.executor().ssh_port() == 2222);
  assert(config.executor().execution_deadline_ms() == 30000);
  assert(config.executor().policy_denial_pattern() == "denied by acl");
  assert(config.deploy().restart_policy() == "always");

  // Unset values still get defaults.
  assert(config.executor().ssh_binary() == "ssh");
  assert(config.executor().connect_timeout_s() == 25);
}

void TestNoFileYieldsDefaults() {
  ::unsetenv("SIDECAR_PORT");
  auto config = ConfigLoader::Load("");

  assert(config.server().bind_address() == "0.0.0.0:9000");
  assert(config.overlay().hostname() == "ts-sidecar");
  assert(config.overlay().auth_key_env() == "TS_AUTHKEY");
  assert(config.executor().remote_user() == "root");
  assert(config.executor().ssh_port() == 22);
  assert(config.executor().probe_timeout_ms() == 20000);
  assert(config.executor().execution_deadline_ms() == 60000);
  assert(config.executor().server_alive_interval_s() == 10);
  assert(config.executor().policy_denial_pattern() == "policy does not permit");
  assert(config.deploy().restart_policy() == "unless-stopped");
}

void TestSidecarPortOverridesBindPort() {
  ::setenv("SIDECAR_PORT", "9100", 1);
  auto defaults = ConfigLoader::Load("");
  assert(defaults.server().bind_address() == "0.0.0.0:9100");

  auto config = ConfigLoader::LoadFromYamlString("server:\n  bind_address: \"127.0.0.1:7000\"\n");
  ConfigLoader::ApplyEnvironmentOverrides(&config);
  assert(config.server().bind_address() == "127.0.0.1:9100");

  ::setenv("SIDECAR_PORT", "not-a-port", 1);
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::Load(""); }));
  ::unsetenv("SIDECAR_PORT");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:9000"
unknown_field: 123
)");

  assert(ThrowsRuntimeError([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); }) && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  ::unsetenv("SIDECAR_PORT");

  const auto bad_policy = WriteYaml("bad_policy", "deploy:\n  restart_policy: on-failure\n");
  assert(ThrowsRuntimeError([&] { (void)ConfigLoader::Load(bad_policy.string()); }));

  const auto bad_probe = WriteYaml("bad_probe", "executor:\n  probe_timeout_ms: 90000\n  execution_deadline_ms: 60000\n");
  assert(ThrowsRuntimeError([&] { (void)ConfigLoader::Load(bad_probe.string()); }));
}

void TestEmptyFileIsAllDefaults() {
  ::unsetenv("SIDECAR_PORT");
  const auto yaml_path = WriteYaml("empty", "");
  auto       config    = ConfigLoader::Load(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:9000");
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestNoFileYieldsDefaults();
  TestSidecarPortOverridesBindPort();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestEmptyFileIsAllDefaults();

  std::cout << "edgerun_unit_config_loader: pass\n";
  return 0;
}
