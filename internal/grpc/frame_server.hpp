#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "framecomp/v1/frame_service.grpc.pb.h"
#include "internal/service/frame_service.hpp"

namespace framecomp::grpc {

/*
  Thin adapter: request validation and errors live in FrameService.
*/
class FrameServer final : public framecomp::v1::FrameProjectService::Service {
public:
  explicit FrameServer(std::shared_ptr<framecomp::service::FrameService> svc);

  ::grpc::Status CreateFrameProject(::grpc::ServerContext*, const framecomp::v1::CreateFrameProjectRequest*, framecomp::v1::CreateFrameProjectResponse*) override;
  ::grpc::Status GetFrameProject(::grpc::ServerContext*, const framecomp::v1::GetFrameProjectRequest*, framecomp::v1::GetFrameProjectResponse*) override;
  ::grpc::Status ListFrameProjects(::grpc::ServerContext*, const framecomp::v1::ListFrameProjectsRequest*, framecomp::v1::ListFrameProjectsResponse*) override;
  ::grpc::Status SetOverlayRect(::grpc::ServerContext*, const framecomp::v1::SetOverlayRectRequest*, framecomp::v1::SetOverlayRectResponse*) override;
  ::grpc::Status GeneratePreview(::grpc::ServerContext*, const framecomp::v1::GeneratePreviewRequest*, framecomp::v1::GeneratePreviewResponse*) override;
  ::grpc::Status TriggerBulkRun(::grpc::ServerContext*, const framecomp::v1::TriggerBulkRunRequest*, framecomp::v1::TriggerBulkRunResponse*) override;
  ::grpc::Status GetRunStatus(::grpc::ServerContext*, const framecomp::v1::GetRunStatusRequest*, framecomp::v1::GetRunStatusResponse*) override;
  ::grpc::Status ListOutputs(::grpc::ServerContext*, const framecomp::v1::ListOutputsRequest*, framecomp::v1::ListOutputsResponse*) override;
  ::grpc::Status GetOutputImage(::grpc::ServerContext*, const framecomp::v1::GetOutputImageRequest*, framecomp::v1::GetOutputImageResponse*) override;
  ::grpc::Status DeleteFrameProject(::grpc::ServerContext*, const framecomp::v1::DeleteFrameProjectRequest*, google::protobuf::Empty*) override;

private:
  std::shared_ptr<framecomp::service::FrameService> service_;
};

}
