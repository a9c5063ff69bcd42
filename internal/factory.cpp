#include "factory.hpp"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/dispatch/execution_store.hpp"
#include "internal/exec/process_runner.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/execution_server.hpp"
#include "internal/grpc/health_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/overlay/tailscale_overlay.hpp"
#include "internal/remote/denial_classifier.hpp"
#include "internal/remote/executor_chain.hpp"
#include "internal/remote/prober.hpp"
#include "internal/remote/ssh_client.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/execution_service.hpp"
#include "internal/service/health_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace edgerun::factory {

using observability::StringField;

namespace {

std::string ReadCredential(const std::string& env_name) {
  const char* value = std::getenv(env_name.c_str());
  return value ? std::string(value) : std::string();
}

void BringUpOverlay(overlay::OverlayNetwork& overlay, const std::string& credential, const std::string& env_name, std::chrono::milliseconds timeout) {
  if (credential.empty()) {
    EDGERUN_LOG_WARN("Overlay auth key not set, executions will fail until it is", {StringField("env", env_name)});
    return;
  }

  try {
    overlay.Initialize(credential, util::Deadline::After(timeout));
  } catch (const util::NetworkUninitialized& e) {
    EDGERUN_LOG_WARN("Overlay initialization failed, will retry per execution", {StringField("error", e.what())});
  }
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const edgerun::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto& overlay_cfg  = config.overlay();
  const auto& executor_cfg = config.executor();

  // ------------------------------------------------------------------
  // Overlay network (process-wide)
  // ------------------------------------------------------------------
  auto runner = std::make_shared<exec::ProcessRunner>();

  overlay::TailscaleOptions tailscale;
  tailscale.binary       = overlay_cfg.tailscale_binary();
  tailscale.hostname     = overlay_cfg.hostname();
  tailscale.socket_path  = overlay_cfg.socket_path();
  tailscale.init_timeout = std::chrono::milliseconds(overlay_cfg.init_timeout_ms());

  auto overlay    = std::make_shared<overlay::TailscaleOverlay>(tailscale, runner);
  auto credential = ReadCredential(overlay_cfg.auth_key_env());
  BringUpOverlay(*overlay, credential, overlay_cfg.auth_key_env(), tailscale.init_timeout);

  // ------------------------------------------------------------------
  // Executor chain
  // ------------------------------------------------------------------
  const auto ssh_port = static_cast<uint16_t>(executor_cfg.ssh_port());

  remote::SshOptions ssh;
  ssh.binary                  = executor_cfg.ssh_binary();
  ssh.port                    = ssh_port;
  ssh.connect_timeout_s       = executor_cfg.connect_timeout_s();
  ssh.server_alive_interval_s = executor_cfg.server_alive_interval_s();

  auto primary = std::make_shared<remote::SshClient>(ssh, runner);
  auto prober  = std::make_shared<remote::Prober>(overlay, ssh_port, std::chrono::milliseconds(executor_cfg.probe_timeout_ms()));

  remote::ExecutorChainOptions chain_options;
  chain_options.remote_user        = executor_cfg.remote_user();
  chain_options.overlay_credential = credential;

  auto chain = std::make_shared<remote::ExecutorChain>(overlay, prober, primary, remote::SubstringDenialClassifier(executor_cfg.policy_denial_pattern()),
                                                       chain_options);

  // ------------------------------------------------------------------
  // Dispatcher
  // ------------------------------------------------------------------
  dispatch::DispatcherOptions dispatcher_options;
  dispatcher_options.execution_deadline     = std::chrono::milliseconds(executor_cfg.execution_deadline_ms());
  dispatcher_options.builder.restart_policy = config.deploy().restart_policy();

  auto store      = std::make_shared<dispatch::ExecutionStore>();
  auto dispatcher = std::make_shared<dispatch::Dispatcher>(store, chain, dispatcher_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.dispatcher = dispatcher;
  ctx.overlay    = overlay;

  auto execution_service = std::make_shared<service::ExecutionService>(ctx);
  auto health_service    = std::make_shared<service::HealthService>(ctx);
  auto admin_service     = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ExecutionServer>(execution_service));
  app.grpc_services.push_back(std::make_unique<grpc::HealthServer>(health_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  app.dispatcher = dispatcher;
  app.overlay    = overlay;

  return app;
}

} // namespace edgerun::factory
