#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "framecomp/v1.hpp"
#include "internal/bulk/run_queue.hpp"
#include "internal/bulk/run_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/image/compositor.hpp"
#include "internal/preview/preview_engine.hpp"
#include "internal/storage/blob_store.hpp"

namespace framecomp::core {

/*
  Domain entry point for frame projects.

  Owns the project lifecycle (draft → rect_set → processing →
  completed | failed), keeps template and output blobs in step with the
  repository, and hands bulk runs to the run queue.
*/
class FrameProjectManager {
 public:
  FrameProjectManager(std::shared_ptr<db::Repository>         repository,
                      storage::BlobStorePtr                   blobs,
                      std::shared_ptr<preview::PreviewEngine> preview,
                      std::shared_ptr<bulk::RunQueue>         queue,
                      std::shared_ptr<bulk::RunRegistry>      registry,
                      image::CompositorOptions                compositor_options);

  framecomp::v1::FrameProject CreateProject(const std::string& name, const std::string& owner, const std::string& template_image,
                                            const std::string& feed_url);

  framecomp::v1::FrameProject              GetProject(const std::string& project_id);
  std::vector<framecomp::v1::FrameProject> ListProjects(const std::string& owner);

  // Throws util::BoundsError without touching the project when rect does not fit.
  framecomp::v1::FrameProject SetOverlayRect(const std::string& project_id, const framecomp::v1::OverlayRect& rect);

  /*
    rect defaults to the project's saved rect; product_image defaults to
    the first usable item of the project's feed.
  */
  preview::PreviewImage GeneratePreview(const std::string& project_id, const std::optional<framecomp::v1::OverlayRect>& rect,
                                        const std::optional<preview::ProductImageRef>& product_image);

  // Throws util::AlreadyRunningError while a run is active for the project.
  framecomp::v1::RunHandle TriggerBulkRun(const std::string& project_id);
  framecomp::v1::RunStatus GetRunStatus(const std::string& project_id);

  framecomp::v1::ListOutputsResponse    ListOutputs(const std::string& project_id, const std::string& search, uint64_t offset,
                                                    uint32_t limit);
  framecomp::v1::GetOutputImageResponse GetOutputImage(const std::string& project_id, const std::string& product_id);

  // Cancels an active run, then removes the project, its outputs and its blobs.
  void DeleteProject(const std::string& project_id);

  framecomp::v1::StatsResponse Stats();

  /*
    Removes blobs nothing refers to:
      outputs/<id>/ of projects that no longer exist
      output blobs without an output row (skipped while the project runs)
      templates without a project
    dry_run only reports them.
  */
  framecomp::v1::CleanupResponse CleanupOrphanedFiles(bool dry_run);

  /*
    Startup only, before any worker runs: projects left PROCESSING by a
    previous process are marked FAILED. Returns how many were reset.
  */
  uint64_t RecoverInterruptedRuns();

 private:
  db::model::FrameProjectRecord LoadProject(db::Transaction& tx, const std::string& project_id);
  image::FrameTemplate          LoadFrame(const db::model::FrameProjectRecord& project);
  std::vector<std::string>      ReferencedOutputKeys(const std::string& project_id);

  std::shared_ptr<db::Repository>         repository_;
  storage::BlobStorePtr                   blobs_;
  std::shared_ptr<preview::PreviewEngine> preview_;
  std::shared_ptr<bulk::RunQueue>         queue_;
  std::shared_ptr<bulk::RunRegistry>      registry_;
  image::CompositorOptions                compositor_options_;

  // template blobs are written before their project row
  std::shared_mutex template_mutex_;
};

// Record ↔ wire conversions, shared with tests.
framecomp::v1::FrameProject ToProto(const db::model::FrameProjectRecord& record);
framecomp::v1::Output       ToProto(const db::model::OutputRecord& record);

} // namespace framecomp::core
