#pragma once

#include "framecomp/v1/health_service.pb.h"
#include "service_context.hpp"

namespace framecomp::service {

/*
  Cheap probes. None of them touch feeds, fetches or the compositor.
*/
class HealthService {
public:
  explicit HealthService(ServiceContext ctx);

  framecomp::v1::HealthResponse Liveness(const framecomp::v1::HealthRequest& req);
  framecomp::v1::HealthResponse Storage(const framecomp::v1::HealthRequest& req);
  framecomp::v1::HealthResponse TaskQueue(const framecomp::v1::HealthRequest& req);

private:
  ServiceContext ctx_;
};

}
