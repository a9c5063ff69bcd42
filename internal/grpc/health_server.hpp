#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "edgerun/v1/health_service.grpc.pb.h"
#include "internal/service/health_service.hpp"

namespace edgerun::grpc {

class HealthServer final : public edgerun::v1::HealthService::Service {
public:
  explicit HealthServer(std::shared_ptr<edgerun::service::HealthService> svc);

  ::grpc::Status GetReadiness(::grpc::ServerContext*,
                              const edgerun::v1::GetReadinessRequest*,
                              edgerun::v1::GetReadinessResponse*) override;

private:
  std::shared_ptr<edgerun::service::HealthService> service_;
};

}
