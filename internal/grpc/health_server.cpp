#include "health_server.hpp"

#include "grpc_error.hpp"
#include "framecomp/v1.hpp"

namespace framecomp::grpc {

HealthServer::HealthServer(std::shared_ptr<framecomp::service::HealthService> svc) : service_(std::move(svc)) {
}

::grpc::Status HealthServer::Liveness(::grpc::ServerContext*, const framecomp::v1::HealthRequest* req, framecomp::v1::HealthResponse* resp) {
  try {
    *resp = service_->Liveness(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HealthServer::Storage(::grpc::ServerContext*, const framecomp::v1::HealthRequest* req, framecomp::v1::HealthResponse* resp) {
  try {
    *resp = service_->Storage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HealthServer::TaskQueue(::grpc::ServerContext*, const framecomp::v1::HealthRequest* req, framecomp::v1::HealthResponse* resp) {
  try {
    *resp = service_->TaskQueue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace framecomp::grpc
