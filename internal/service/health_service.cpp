#include "health_service.hpp"

#include <utility>

#include "internal/overlay/overlay_network.hpp"
#include "internal/util/time.hpp"
#include "edgerun/v1.hpp"
#include "observe_rpc.hpp"

namespace edgerun::service {

using namespace edgerun::v1;

HealthService::HealthService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// Liveness of the sidecar itself; overlay readiness is reported, not required.
GetReadinessResponse HealthService::GetReadiness(const GetReadinessRequest&) {
  return ObserveRpc("HealthService.GetReadiness", {}, [&] {
    const bool ready = ctx_.overlay && ctx_.overlay->IsReady();

    GetReadinessResponse resp;
    resp.set_status("ok");
    resp.set_version(kSidecarVersion);
    resp.set_overlay_ready(ready);
    resp.set_message(ready ? "Sidecar running" : "Sidecar running, overlay network not ready");
    *resp.mutable_time() = util::ToProto(util::Now());
    return resp;
  });
}

} // namespace edgerun::service
