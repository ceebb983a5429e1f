#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "framecomp/v1.hpp"

namespace framecomp::grpc {

AdminServer::AdminServer(std::shared_ptr<framecomp::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const framecomp::v1::StatsRequest* req, framecomp::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::CleanupOrphanedFiles(::grpc::ServerContext*, const framecomp::v1::CleanupRequest* req,
                                                 framecomp::v1::CleanupResponse* resp) {
  try {
    *resp = service_->CleanupOrphanedFiles(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace framecomp::grpc
