#include "admin_service.hpp"

#include <utility>

#include "internal/dispatch/dispatcher.hpp"
#include "edgerun/v1.hpp"
#include "observe_rpc.hpp"

namespace edgerun::service {

using namespace edgerun::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", {}, [&] {
    const auto counts = ctx_.dispatcher->Stats();

    StatsResponse resp;
    resp.set_executions_total(counts.total);
    resp.set_pending(counts.pending);
    resp.set_succeeded(counts.succeeded);
    resp.set_failed(counts.failed);
    return resp;
  });
}

} // namespace edgerun::service
