#pragma once

#include "framecomp/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace framecomp::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  framecomp::v1::StatsResponse
  Stats(const framecomp::v1::StatsRequest& req);

  framecomp::v1::CleanupResponse
  CleanupOrphanedFiles(const framecomp::v1::CleanupRequest& req);

private:
  ServiceContext ctx_;
};

}
