#include "admin_service.hpp"

#include "internal/core/frame_project_manager.hpp"
#include "observe_rpc.hpp"
#include "framecomp/v1.hpp"

namespace framecomp::service {

using namespace framecomp::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] { return ctx_.manager->Stats(); });
}

CleanupResponse AdminService::CleanupOrphanedFiles(const CleanupRequest& req) {
  return ObserveRpc("AdminService.CleanupOrphanedFiles", "", [&] { return ctx_.manager->CleanupOrphanedFiles(req.dry_run()); });
}

} // namespace framecomp::service
