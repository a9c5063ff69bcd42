#pragma once

#include <memory>

namespace edgerun::dispatch { class Dispatcher; }
namespace edgerun::overlay { class OverlayNetwork; }

namespace edgerun::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<edgerun::dispatch::Dispatcher> dispatcher;
  std::shared_ptr<edgerun::overlay::OverlayNetwork> overlay;
};

}
