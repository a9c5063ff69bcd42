#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace edgerun::dispatch { class Dispatcher; }
namespace edgerun::overlay { class OverlayNetwork; }

namespace edgerun::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<dispatch::Dispatcher>    dispatcher;
  std::shared_ptr<overlay::OverlayNetwork> overlay;
};

/*
  Build

  Constructs the entire backend based on runtime config. This is the
  composition root: the only place that knows the concrete overlay and
  transport types.

  A failed overlay bring-up is logged, not thrown; executions retry it lazily.
*/
Application Build(const edgerun::runtime::config::RuntimeConfig& config);

} // namespace edgerun::factory
