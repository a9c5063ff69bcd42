#pragma once

#include "edgerun/v1/health_service.pb.h"
#include "service_context.hpp"

namespace edgerun::service {

inline constexpr char kSidecarVersion[] = "0.1.0";

class HealthService {
 public:
  explicit HealthService(ServiceContext ctx);

  edgerun::v1::GetReadinessResponse GetReadiness(const edgerun::v1::GetReadinessRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace edgerun::service
