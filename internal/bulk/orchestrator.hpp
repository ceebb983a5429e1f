#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "framecomp/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/feed/feed_fetcher.hpp"
#include "internal/image/compositor.hpp"
#include "internal/net/fetcher.hpp"
#include "internal/storage/blob_store.hpp"
#include "item_pool.hpp"
#include "run_registry.hpp"
#include "run_task.hpp"

namespace framecomp::bulk {

struct BulkOptions {
  // persist project counters every N processed items (0: only at the end)
  uint32_t progress_interval = 10;
};

/*
  Drives one bulk run:

      load project + template ──> validate rect ──> fetch/parse feed
          ──> fan out items on the ItemPool ──> wait for all ──> aggregate

  Configuration and feed errors end the run with zero attempted items.
  Item errors become failed Output rows and never stop the run.

  The cancel flag is checked before every Output write; a deleted project
  ends the run as CANCELLED without errors.
*/
class BulkOrchestrator {
 public:
  BulkOrchestrator(std::shared_ptr<db::Repository>    repository,
                   storage::BlobStorePtr              blobs,
                   std::shared_ptr<feed::FeedFetcher> feeds,
                   std::shared_ptr<net::Fetcher>      fetcher,
                   std::shared_ptr<image::Compositor> compositor,
                   std::shared_ptr<ItemPool>          pool,
                   std::shared_ptr<RunRegistry>       registry,
                   BulkOptions                        options = {});

  // Blocks the calling thread until every dispatched item resolved.
  framecomp::v1::BulkRunResult Execute(const RunTask& task);

  /*
    Ends a queued run that will never execute: the run is CANCELLED with
    reason and its project leaves PROCESSING. Never throws.
  */
  void Abandon(const RunTask& task, const std::string& reason);

 private:
  struct RunContext {
    RunTask                       task;
    CancelFlag                    cancelled;
    db::model::FrameProjectRecord project;
    image::FrameTemplate          frame;
    image::OverlayRect            rect;

    std::mutex                   mutex;
    std::condition_variable      idle;
    uint64_t                     pending   = 0;
    uint64_t                     processed = 0;
    framecomp::v1::BulkRunResult result;
  };

  void Drive(RunContext& ctx);
  std::vector<feed::ProductRecord> LastWins(const std::vector<feed::ParseOutcome>& outcomes, RunContext& ctx) const;

  void ProcessItem(RunContext& ctx, const feed::ProductRecord& record);
  // true when the row was written; otherwise the output's blob is removed
  bool WriteOutput(RunContext& ctx, const db::model::OutputRecord& output);
  void DropBlob(const std::string& key);

  // total_items is only written when given
  void PersistProgress(RunContext& ctx, std::optional<uint64_t> total_items);
  void FinishProject(RunContext& ctx, framecomp::v1::RunState state, const std::string& error);

  std::shared_ptr<db::Repository>    repository_;
  storage::BlobStorePtr              blobs_;
  std::shared_ptr<feed::FeedFetcher> feeds_;
  std::shared_ptr<net::Fetcher>      fetcher_;
  std::shared_ptr<image::Compositor> compositor_;
  std::shared_ptr<ItemPool>          pool_;
  std::shared_ptr<RunRegistry>       registry_;
  BulkOptions                        options_;
};

} // namespace framecomp::bulk
