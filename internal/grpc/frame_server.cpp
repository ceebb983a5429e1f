#include "frame_server.hpp"

#include "grpc_error.hpp"
#include "framecomp/v1.hpp"

namespace framecomp::grpc {

using namespace framecomp::v1;

FrameServer::FrameServer(std::shared_ptr<framecomp::service::FrameService> svc) : service_(std::move(svc)) {
}

::grpc::Status FrameServer::CreateFrameProject(::grpc::ServerContext*, const CreateFrameProjectRequest* req, CreateFrameProjectResponse* resp) {
  try {
    *resp = service_->CreateFrameProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::GetFrameProject(::grpc::ServerContext*, const GetFrameProjectRequest* req, GetFrameProjectResponse* resp) {
  try {
    *resp = service_->GetFrameProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::ListFrameProjects(::grpc::ServerContext*, const ListFrameProjectsRequest* req, ListFrameProjectsResponse* resp) {
  try {
    *resp = service_->ListFrameProjects(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::SetOverlayRect(::grpc::ServerContext*, const SetOverlayRectRequest* req, SetOverlayRectResponse* resp) {
  try {
    *resp = service_->SetOverlayRect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::GeneratePreview(::grpc::ServerContext*, const GeneratePreviewRequest* req, GeneratePreviewResponse* resp) {
  try {
    *resp = service_->GeneratePreview(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::TriggerBulkRun(::grpc::ServerContext*, const TriggerBulkRunRequest* req, TriggerBulkRunResponse* resp) {
  try {
    *resp = service_->TriggerBulkRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::GetRunStatus(::grpc::ServerContext*, const GetRunStatusRequest* req, GetRunStatusResponse* resp) {
  try {
    *resp = service_->GetRunStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::ListOutputs(::grpc::ServerContext*, const ListOutputsRequest* req, ListOutputsResponse* resp) {
  try {
    *resp = service_->ListOutputs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::GetOutputImage(::grpc::ServerContext*, const GetOutputImageRequest* req, GetOutputImageResponse* resp) {
  try {
    *resp = service_->GetOutputImage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FrameServer::DeleteFrameProject(::grpc::ServerContext*, const DeleteFrameProjectRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteFrameProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace framecomp::grpc
