#include "frame_service.hpp"

#include <optional>

#include "internal/core/frame_project_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "framecomp/v1.hpp"

namespace framecomp::service {

using namespace framecomp::v1;

namespace {

void RequireProjectId(const std::string& project_id) {
  if (project_id.empty()) {
    throw util::ValidationError("project_id is required");
  }
}

} // namespace

FrameService::FrameService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateFrameProjectResponse FrameService::CreateFrameProject(const CreateFrameProjectRequest& req) {
  return ObserveRpc("FrameProjectService.CreateFrameProject", "", [&] {
    CreateFrameProjectResponse resp;
    *resp.mutable_project() = ctx_.manager->CreateProject(req.name(), req.owner(), req.template_image(), req.feed_url());
    return resp;
  });
}

GetFrameProjectResponse FrameService::GetFrameProject(const GetFrameProjectRequest& req) {
  return ObserveRpc("FrameProjectService.GetFrameProject", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    GetFrameProjectResponse resp;
    *resp.mutable_project() = ctx_.manager->GetProject(req.project_id());
    return resp;
  });
}

ListFrameProjectsResponse FrameService::ListFrameProjects(const ListFrameProjectsRequest& req) {
  return ObserveRpc("FrameProjectService.ListFrameProjects", "", [&] {
    ListFrameProjectsResponse resp;
    for (auto& project : ctx_.manager->ListProjects(req.owner())) {
      *resp.add_projects() = std::move(project);
    }
    return resp;
  });
}

SetOverlayRectResponse FrameService::SetOverlayRect(const SetOverlayRectRequest& req) {
  return ObserveRpc("FrameProjectService.SetOverlayRect", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    if (!req.has_rect()) {
      throw util::BoundsError("rect is required");
    }
    SetOverlayRectResponse resp;
    *resp.mutable_project() = ctx_.manager->SetOverlayRect(req.project_id(), req.rect());
    return resp;
  });
}

GeneratePreviewResponse FrameService::GeneratePreview(const GeneratePreviewRequest& req) {
  return ObserveRpc("FrameProjectService.GeneratePreview", req.project_id(), [&] {
    RequireProjectId(req.project_id());

    std::optional<OverlayRect> rect;
    if (req.has_rect()) rect = req.rect();

    std::optional<preview::ProductImageRef> product_image;
    switch (req.product_image_case()) {
      case GeneratePreviewRequest::kImageBytes:
        product_image = preview::InlineImage{req.image_bytes()};
        break;
      case GeneratePreviewRequest::kImageUrl:
        product_image = preview::ImageUrl{req.image_url()};
        break;
      default:
        break;
    }

    auto image = ctx_.manager->GeneratePreview(req.project_id(), rect, product_image);

    GeneratePreviewResponse resp;
    resp.set_image(std::move(image.bytes));
    resp.set_format(image.format);
    resp.set_mime_type(image.mime_type);
    resp.set_width(image.width);
    resp.set_height(image.height);
    resp.set_product_id(image.product_id);
    return resp;
  });
}

TriggerBulkRunResponse FrameService::TriggerBulkRun(const TriggerBulkRunRequest& req) {
  return ObserveRpc("FrameProjectService.TriggerBulkRun", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    TriggerBulkRunResponse resp;
    *resp.mutable_handle() = ctx_.manager->TriggerBulkRun(req.project_id());
    return resp;
  });
}

GetRunStatusResponse FrameService::GetRunStatus(const GetRunStatusRequest& req) {
  return ObserveRpc("FrameProjectService.GetRunStatus", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    GetRunStatusResponse resp;
    *resp.mutable_status() = ctx_.manager->GetRunStatus(req.project_id());
    return resp;
  });
}

ListOutputsResponse FrameService::ListOutputs(const ListOutputsRequest& req) {
  return ObserveRpc("FrameProjectService.ListOutputs", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    return ctx_.manager->ListOutputs(req.project_id(), req.search_term(), req.offset(), req.limit());
  });
}

GetOutputImageResponse FrameService::GetOutputImage(const GetOutputImageRequest& req) {
  return ObserveRpc("FrameProjectService.GetOutputImage", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    if (req.product_id().empty()) {
      throw util::ValidationError("product_id is required");
    }
    return ctx_.manager->GetOutputImage(req.project_id(), req.product_id());
  });
}

void FrameService::DeleteFrameProject(const DeleteFrameProjectRequest& req) {
  ObserveRpc("FrameProjectService.DeleteFrameProject", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    ctx_.manager->DeleteProject(req.project_id());
  });
}

} // namespace framecomp::service
