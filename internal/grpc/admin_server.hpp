#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "framecomp/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace framecomp::grpc {

class AdminServer final : public framecomp::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<framecomp::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                     const framecomp::v1::StatsRequest*,
                     framecomp::v1::StatsResponse*) override;

  ::grpc::Status CleanupOrphanedFiles(::grpc::ServerContext*,
                                    const framecomp::v1::CleanupRequest*,
                                    framecomp::v1::CleanupResponse*) override;

private:
  std::shared_ptr<framecomp::service::AdminService> service_;
};

}
