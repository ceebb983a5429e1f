#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/frame_server.hpp"
#include "internal/image/image_codec.hpp"
#include "internal/service/frame_service.hpp"
#include "support/fakes.hpp"
#include "support/harness.hpp"

namespace {

using framecomp::testing::AtomFeed;
using framecomp::testing::FakeFetcher;
using framecomp::testing::Harness;
using framecomp::testing::SolidImage;
using namespace framecomp::v1;

const cv::Vec3b kTemplateColor(200, 120, 40);
const cv::Vec3b kProductColor(30, 30, 220);

const std::string kFeedUrl        = "https://shop.example.com/feeds/products.xml";
const std::string kGoodImageUrl   = "https://cdn.example.com/images/good.png";
const std::string kUnreachableUrl = "https://unreachable.example.com/images/missing.png";

void TestFeedToOutputs() {
  Harness h(2);
  h.http->Serve(kFeedUrl, AtomFeed({{"good", kGoodImageUrl}, {"broken", kUnreachableUrl}}), "application/atom+xml");
  h.http->Serve(kGoodImageUrl,
                SolidImage(400, 300, cv::Scalar(kProductColor[0], kProductColor[1], kProductColor[2])),
                "image/png");
  h.http->Fail(kUnreachableUrl, FakeFetcher::Failure::kFetch);

  auto                         service = std::make_shared<framecomp::service::FrameService>(h.Context());
  framecomp::grpc::FrameServer server(service);
  ::grpc::ServerContext        ctx;

  CreateFrameProjectRequest create;
  create.set_name("autumn sale");
  create.set_owner("marketing");
  create.set_template_image(SolidImage(800, 600, cv::Scalar(kTemplateColor[0], kTemplateColor[1], kTemplateColor[2])));
  create.set_feed_url(kFeedUrl);
  CreateFrameProjectResponse created;
  assert(server.CreateFrameProject(&ctx, &create, &created).ok());
  const auto project_id = created.project().id();
  assert(created.project().template_width() == 800);
  assert(created.project().template_height() == 600);

  SetOverlayRectRequest set_rect;
  set_rect.set_project_id(project_id);
  set_rect.mutable_rect()->set_x(50);
  set_rect.mutable_rect()->set_y(50);
  set_rect.mutable_rect()->set_width(200);
  set_rect.mutable_rect()->set_height(150);
  SetOverlayRectResponse rect_set;
  assert(server.SetOverlayRect(&ctx, &set_rect, &rect_set).ok());

  // preview from the feed picks the first usable item and stores nothing
  GeneratePreviewRequest  preview_req;
  GeneratePreviewResponse preview;
  preview_req.set_project_id(project_id);
  assert(server.GeneratePreview(&ctx, &preview_req, &preview).ok());
  assert(preview.product_id() == "good");
  assert(preview.width() == 800 && preview.height() == 600);

  TriggerBulkRunRequest  trigger;
  TriggerBulkRunResponse triggered;
  trigger.set_project_id(project_id);
  assert(server.TriggerBulkRun(&ctx, &trigger, &triggered).ok());
  assert(triggered.handle().project_id() == project_id);

  h.WaitForRun(project_id);

  GetRunStatusRequest  status_req;
  GetRunStatusResponse status;
  status_req.set_project_id(project_id);
  assert(server.GetRunStatus(&ctx, &status_req, &status).ok());
  assert(status.status().state() == RUN_STATE_COMPLETED);
  assert(status.status().handle().run_id() == triggered.handle().run_id());
  assert(status.status().result().attempted() == 2);
  assert(status.status().result().succeeded() == 1);
  assert(status.status().result().failed() == 1);
  assert(status.status().result().failures_size() == 1);
  assert(status.status().result().failures(0).product_id() == "broken");

  ListOutputsRequest  list_req;
  ListOutputsResponse outputs;
  list_req.set_project_id(project_id);
  assert(server.ListOutputs(&ctx, &list_req, &outputs).ok());
  assert(outputs.total() == 2 && outputs.filtered() == 2);
  for (const auto& row : outputs.rows()) {
    if (row.product_id() == "good") {
      assert(row.status() == OUTPUT_STATUS_SUCCEEDED);
      assert(!row.image_key().empty());
    } else {
      assert(row.product_id() == "broken");
      assert(row.status() == OUTPUT_STATUS_FAILED);
      assert(row.failure_reason().rfind("image fetch failed: ", 0) == 0);
      assert(row.image_key().empty());
    }
  }

  GetOutputImageRequest  image_req;
  GetOutputImageResponse image;
  image_req.set_project_id(project_id);
  image_req.set_product_id("good");
  assert(server.GetOutputImage(&ctx, &image_req, &image).ok());
  assert(image.mime_type() == "image/png");

  auto pixels = framecomp::image::Decode(image.image());
  assert(pixels.cols == 800 && pixels.rows == 600);

  // product fills exactly (50,50)-(249,199)
  assert(pixels.at<cv::Vec3b>(50, 50) == kProductColor);
  assert(pixels.at<cv::Vec3b>(199, 249) == kProductColor);
  assert(pixels.at<cv::Vec3b>(125, 150) == kProductColor);
  assert(pixels.at<cv::Vec3b>(49, 49) == kTemplateColor);
  assert(pixels.at<cv::Vec3b>(49, 150) == kTemplateColor);
  assert(pixels.at<cv::Vec3b>(200, 150) == kTemplateColor);
  assert(pixels.at<cv::Vec3b>(125, 250) == kTemplateColor);
  assert(pixels.at<cv::Vec3b>(599, 799) == kTemplateColor);

  GetFrameProjectRequest  get_req;
  GetFrameProjectResponse project;
  get_req.set_project_id(project_id);
  assert(server.GetFrameProject(&ctx, &get_req, &project).ok());
  assert(project.project().status() == PROJECT_STATUS_COMPLETED);
  assert(project.project().total_items() == 2);
  assert(project.project().success_rate() == 50.0);
}

} // namespace

int main() {
  TestFeedToOutputs();

  std::cout << "framecomp_integration_end_to_end: pass\n";
  return 0;
}
