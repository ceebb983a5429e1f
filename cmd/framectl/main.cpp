#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "framecomp/v1.hpp"

using namespace framecomp::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  framectl <addr> create <name> <template_file> [feed_url] [owner]\n"
            << "  framectl <addr> get <project_id>\n"
            << "  framectl <addr> list [owner]\n"
            << "  framectl <addr> set-rect <project_id> <x> <y> <width> <height>\n"
            << "  framectl <addr> preview <project_id> <out_file> [image_url|@image_file]\n"
            << "  framectl <addr> run <project_id>\n"
            << "  framectl <addr> status <project_id>\n"
            << "  framectl <addr> outputs <project_id> [search] [offset] [limit]\n"
            << "  framectl <addr> image <project_id> <product_id> <out_file>\n"
            << "  framectl <addr> delete <project_id>\n"
            << "  framectl <addr> health\n"
            << "  framectl <addr> stats\n"
            << "  framectl <addr> cleanup [--dry-run]\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot read " << path << "\n";
    std::exit(1);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static bool WriteFile(const std::string& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

static void PrintProject(const FrameProject& project) {
  std::cout << "id=" << project.id() << "\n";
  std::cout << "name=" << project.name() << "\n";
  std::cout << "status=" << ProjectStatus_Name(project.status()) << "\n";
  std::cout << "template=" << project.template_width() << "x" << project.template_height() << " "
            << ImageFormat_Name(project.template_format()) << "\n";
  if (project.rect_set()) {
    const auto& rect = project.rect();
    std::cout << "rect=" << rect.x() << "," << rect.y() << "," << rect.width() << "," << rect.height() << "\n";
  }
  if (!project.feed_url().empty()) std::cout << "feed=" << project.feed_url() << "\n";
  std::cout << "items=" << project.succeeded_items() << " ok / " << project.failed_items() << " failed / " << project.total_items()
            << " total\n";
  if (!project.last_error().empty()) std::cout << "last_error=" << project.last_error() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(64 * 1024 * 1024);
  args.SetMaxSendMessageSize(64 * 1024 * 1024);
  auto channel = grpc::CreateCustomChannel(addr, grpc::InsecureChannelCredentials(), args);

  auto frame_stub  = FrameProjectService::NewStub(channel);
  auto health_stub = HealthService::NewStub(channel);
  auto admin_stub  = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 5) return 1;

    CreateFrameProjectRequest req;
    req.set_name(argv[3]);
    req.set_template_image(ReadFile(argv[4]));
    if (argc >= 6) req.set_feed_url(argv[5]);
    if (argc >= 7) req.set_owner(argv[6]);

    CreateFrameProjectResponse resp;

    auto status = frame_stub->CreateFrameProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintProject(resp.project());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetFrameProjectRequest req;
    req.set_project_id(argv[3]);

    GetFrameProjectResponse resp;

    auto status = frame_stub->GetFrameProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintProject(resp.project());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListFrameProjectsRequest req;
    if (argc >= 4) req.set_owner(argv[3]);

    ListFrameProjectsResponse resp;

    auto status = frame_stub->ListFrameProjects(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& project : resp.projects()) {
      std::cout << project.id() << "  " << ProjectStatus_Name(project.status()) << "  " << project.name() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-rect") {
    if (argc < 8) return 1;

    SetOverlayRectRequest req;
    req.set_project_id(argv[3]);
    req.mutable_rect()->set_x(static_cast<uint32_t>(std::stoul(argv[4])));
    req.mutable_rect()->set_y(static_cast<uint32_t>(std::stoul(argv[5])));
    req.mutable_rect()->set_width(static_cast<uint32_t>(std::stoul(argv[6])));
    req.mutable_rect()->set_height(static_cast<uint32_t>(std::stoul(argv[7])));

    SetOverlayRectResponse resp;

    auto status = frame_stub->SetOverlayRect(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintProject(resp.project());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "preview") {
    if (argc < 5) return 1;

    GeneratePreviewRequest req;
    req.set_project_id(argv[3]);
    if (argc >= 6) {
      std::string source = argv[5];
      if (!source.empty() && source.front() == '@') {
        req.set_image_bytes(ReadFile(source.substr(1)));
      } else {
        req.set_image_url(source);
      }
    }

    GeneratePreviewResponse resp;

    auto status = frame_stub->GeneratePreview(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!WriteFile(argv[4], resp.image())) {
      std::cerr << "cannot write " << argv[4] << "\n";
      return 2;
    }
    std::cout << resp.mime_type() << " " << resp.width() << "x" << resp.height() << " -> " << argv[4] << "\n";
    if (!resp.product_id().empty()) std::cout << "product=" << resp.product_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run") {
    if (argc < 4) return 1;

    TriggerBulkRunRequest req;
    req.set_project_id(argv[3]);

    TriggerBulkRunResponse resp;

    auto status = frame_stub->TriggerBulkRun(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "run=" << resp.handle().run_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetRunStatusRequest req;
    req.set_project_id(argv[3]);

    GetRunStatusResponse resp;

    auto status = frame_stub->GetRunStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& run = resp.status();
    std::cout << "run=" << run.handle().run_id() << "\n";
    std::cout << "state=" << RunState_Name(run.state()) << "\n";
    std::cout << "processed=" << run.processed() << "/" << run.total_items() << "\n";
    std::cout << "attempted=" << run.result().attempted() << " succeeded=" << run.result().succeeded()
              << " failed=" << run.result().failed() << " skipped=" << run.result().skipped() << "\n";
    for (const auto& failure : run.result().failures()) {
      std::cout << "  failed " << failure.product_id() << ": " << failure.reason() << "\n";
    }
    if (!run.error().empty()) std::cout << "error=" << run.error() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "outputs") {
    if (argc < 4) return 1;

    ListOutputsRequest req;
    req.set_project_id(argv[3]);
    if (argc >= 5) req.set_search_term(argv[4]);
    if (argc >= 6) req.set_offset(static_cast<uint32_t>(std::stoul(argv[5])));
    if (argc >= 7) req.set_limit(static_cast<uint32_t>(std::stoul(argv[6])));

    ListOutputsResponse resp;

    auto status = frame_stub->ListOutputs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "total=" << resp.total() << " filtered=" << resp.filtered() << "\n";
    for (const auto& row : resp.rows()) {
      std::cout << row.product_id() << "  " << OutputStatus_Name(row.status());
      if (!row.failure_reason().empty()) std::cout << "  " << row.failure_reason();
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "image") {
    if (argc < 6) return 1;

    GetOutputImageRequest req;
    req.set_project_id(argv[3]);
    req.set_product_id(argv[4]);

    GetOutputImageResponse resp;

    auto status = frame_stub->GetOutputImage(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!WriteFile(argv[5], resp.image())) {
      std::cerr << "cannot write " << argv[5] << "\n";
      return 2;
    }
    std::cout << resp.mime_type() << " -> " << argv[5] << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteFrameProjectRequest req;
    req.set_project_id(argv[3]);

    google::protobuf::Empty resp;

    auto status = frame_stub->DeleteFrameProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    int exit_code = 0;
    for (const char* probe : {"liveness", "storage", "task_queue"}) {
      grpc::ClientContext probe_ctx;
      HealthRequest       req;
      HealthResponse      resp;

      grpc::Status status;
      if (std::string(probe) == "liveness") {
        status = health_stub->Liveness(&probe_ctx, req, &resp);
      } else if (std::string(probe) == "storage") {
        status = health_stub->Storage(&probe_ctx, req, &resp);
      } else {
        status = health_stub->TaskQueue(&probe_ctx, req, &resp);
      }

      if (!status.ok()) {
        std::cout << probe << "=unreachable " << status.error_message() << "\n";
        exit_code = 2;
        continue;
      }
      std::cout << probe << "=" << (resp.healthy() ? "healthy" : "unhealthy") << " " << resp.detail() << "\n";
      if (!resp.healthy()) exit_code = 2;
    }
    return exit_code;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "projects draft=" << resp.projects_draft() << " rect_set=" << resp.projects_rect_set()
              << " processing=" << resp.projects_processing() << " completed=" << resp.projects_completed()
              << " failed=" << resp.projects_failed() << "\n";
    std::cout << "outputs total=" << resp.outputs_total() << " succeeded=" << resp.outputs_succeeded()
              << " failed=" << resp.outputs_failed() << "\n";
    std::cout << "active_runs=" << resp.active_runs() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup") {
    CleanupRequest req;
    if (argc >= 4) {
      if (std::string(argv[3]) != "--dry-run") {
        Usage();
        return 1;
      }
      req.set_dry_run(true);
    }

    CleanupResponse resp;

    auto status = admin_stub->CleanupOrphanedFiles(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const char* verb = resp.dry_run() ? "would remove " : "removed ";
    for (const auto& key : resp.keys()) std::cout << verb << key << "\n";
    std::cout << "output_dirs=" << resp.orphaned_output_dirs() << " outputs=" << resp.orphaned_outputs()
              << " templates=" << resp.orphaned_templates() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
