#pragma once

#include "framecomp/v1/frame_service.pb.h"
#include "service_context.hpp"

namespace framecomp::service {

class FrameService {
public:
  explicit FrameService(ServiceContext ctx);

  framecomp::v1::CreateFrameProjectResponse CreateFrameProject(const framecomp::v1::CreateFrameProjectRequest& req);
  framecomp::v1::GetFrameProjectResponse GetFrameProject(const framecomp::v1::GetFrameProjectRequest& req);
  framecomp::v1::ListFrameProjectsResponse ListFrameProjects(const framecomp::v1::ListFrameProjectsRequest& req);
  framecomp::v1::SetOverlayRectResponse SetOverlayRect(const framecomp::v1::SetOverlayRectRequest& req);
  framecomp::v1::GeneratePreviewResponse GeneratePreview(const framecomp::v1::GeneratePreviewRequest& req);
  framecomp::v1::TriggerBulkRunResponse TriggerBulkRun(const framecomp::v1::TriggerBulkRunRequest& req);
  framecomp::v1::GetRunStatusResponse GetRunStatus(const framecomp::v1::GetRunStatusRequest& req);
  framecomp::v1::ListOutputsResponse ListOutputs(const framecomp::v1::ListOutputsRequest& req);
  framecomp::v1::GetOutputImageResponse GetOutputImage(const framecomp::v1::GetOutputImageRequest& req);
  void DeleteFrameProject(const framecomp::v1::DeleteFrameProjectRequest& req);

private:
  ServiceContext ctx_;
};

}
