#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "framecomp/v1/health_service.grpc.pb.h"
#include "internal/service/health_service.hpp"

namespace framecomp::grpc {

class HealthServer final : public framecomp::v1::HealthService::Service {
public:
  explicit HealthServer(std::shared_ptr<framecomp::service::HealthService> svc);

  ::grpc::Status Liveness(::grpc::ServerContext*, const framecomp::v1::HealthRequest*, framecomp::v1::HealthResponse*) override;
  ::grpc::Status Storage(::grpc::ServerContext*, const framecomp::v1::HealthRequest*, framecomp::v1::HealthResponse*) override;
  ::grpc::Status TaskQueue(::grpc::ServerContext*, const framecomp::v1::HealthRequest*, framecomp::v1::HealthResponse*) override;

private:
  std::shared_ptr<framecomp::service::HealthService> service_;
};

}
