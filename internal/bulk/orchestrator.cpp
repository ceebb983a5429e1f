#include "orchestrator.hpp"

#include <chrono>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace framecomp::bulk {

using observability::IntField;
using observability::StringField;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

const char* RunOutcome(v1::RunState state) {
  switch (state) {
    case v1::RUN_STATE_COMPLETED:
      return "completed";
    case v1::RUN_STATE_CANCELLED:
      return "cancelled";
    default:
      return "failed";
  }
}

} // namespace

BulkOrchestrator::BulkOrchestrator(std::shared_ptr<db::Repository>    repository,
                                   storage::BlobStorePtr              blobs,
                                   std::shared_ptr<feed::FeedFetcher> feeds,
                                   std::shared_ptr<net::Fetcher>      fetcher,
                                   std::shared_ptr<image::Compositor> compositor,
                                   std::shared_ptr<ItemPool>          pool,
                                   std::shared_ptr<RunRegistry>       registry,
                                   BulkOptions                        options)
    : repository_(std::move(repository)),
      blobs_(std::move(blobs)),
      feeds_(std::move(feeds)),
      fetcher_(std::move(fetcher)),
      compositor_(std::move(compositor)),
      pool_(std::move(pool)),
      registry_(std::move(registry)),
      options_(options) {
}

v1::BulkRunResult BulkOrchestrator::Execute(const RunTask& task) {
  const auto start = std::chrono::steady_clock::now();

  observability::SpanScope span("bulk.run");
  span.SetAttribute("project_id", task.project_id);
  span.SetAttribute("run_id", task.run_id);

  RunContext ctx;
  ctx.task      = task;
  ctx.cancelled = registry_->CancelFlagFor(task.project_id);
  registry_->MarkRunning(task.project_id);

  FRAMECOMP_LOG_INFO("bulk run started", {StringField("project_id", task.project_id), StringField("run_id", task.run_id)});

  v1::RunState state = v1::RUN_STATE_FAILED;
  std::string  error;
  try {
    Drive(ctx);

    if (ctx.cancelled->load()) {
      state = v1::RUN_STATE_CANCELLED;
      error = "run cancelled";
    } else if (ctx.result.succeeded() > 0) {
      state = v1::RUN_STATE_COMPLETED;
    } else {
      error = ctx.result.attempted() == 0 ? "feed has no usable items" : "no item succeeded";
    }
  } catch (const util::NotFound& e) {
    state = v1::RUN_STATE_CANCELLED;
    error = e.what();
  } catch (const std::exception& e) {
    error = e.what();
    span.RecordException(error);
  }

  FinishProject(ctx, state, error);
  registry_->Finish(task.project_id, state, ctx.result, error);

  const char* outcome = RunOutcome(state);
  observability::Metrics::Instance().ObserveRunDurationMs(outcome, ElapsedMs(start));

  FRAMECOMP_LOG_INFO("bulk run finished", {StringField("project_id", task.project_id),
                                           StringField("run_id", task.run_id),
                                           StringField("outcome", outcome),
                                           IntField("attempted", static_cast<int64_t>(ctx.result.attempted())),
                                           IntField("succeeded", static_cast<int64_t>(ctx.result.succeeded())),
                                           IntField("failed", static_cast<int64_t>(ctx.result.failed())),
                                           IntField("skipped", static_cast<int64_t>(ctx.result.skipped())),
                                           StringField("error", error)});
  return ctx.result;
}

void BulkOrchestrator::Drive(RunContext& ctx) {
  {
    auto tx      = repository_->Begin();
    auto project = repository_->GetProject(*tx, ctx.task.project_id);
    tx->Commit();
    if (!project) {
      throw util::NotFound("frame project deleted: " + ctx.task.project_id);
    }
    ctx.project = std::move(*project);
  }

  if (!ctx.project.rect_set) {
    throw util::ConfigurationError("overlay rect is not set");
  }
  if (ctx.project.feed_url.empty()) {
    throw util::ConfigurationError("frame project has no feed url");
  }

  std::string template_bytes;
  try {
    template_bytes = storage::common::ToString(blobs_->Read(ctx.project.template_key));
  } catch (const util::NotFound&) {
    throw util::ConfigurationError("template image missing: " + ctx.project.template_key);
  }
  ctx.frame = image::DecodeTemplate(template_bytes);
  ctx.rect  = image::OverlayRect{ctx.project.rect_x, ctx.project.rect_y, ctx.project.rect_width, ctx.project.rect_height};
  image::ValidateRect(ctx.rect, ctx.frame.Width(), ctx.frame.Height());

  auto records = LastWins(feeds_->FetchAndParse(ctx.project.feed_url), ctx);

  registry_->SetTotal(ctx.task.project_id, records.size());
  PersistProgress(ctx, records.size());

  std::string dispatch_error;
  for (const auto& record : records) {
    {
      std::lock_guard lock(ctx.mutex);
      ++ctx.pending;
    }
    if (!pool_->Submit([this, &ctx, record] { ProcessItem(ctx, record); })) {
      std::lock_guard lock(ctx.mutex);
      --ctx.pending;
      dispatch_error = "item pool is stopped";
      break;
    }
  }

  // fan-in: items reference ctx, so always wait before leaving
  {
    std::unique_lock lock(ctx.mutex);
    ctx.idle.wait(lock, [&] { return ctx.pending == 0; });
  }

  if (!dispatch_error.empty()) {
    throw std::runtime_error(dispatch_error);
  }
}

std::vector<feed::ProductRecord> BulkOrchestrator::LastWins(const std::vector<feed::ParseOutcome>& outcomes, RunContext& ctx) const {
  auto& result = ctx.result;

  std::vector<std::pair<size_t, const feed::ProductRecord*>> ok;
  std::unordered_map<std::string, size_t>                    last;

  for (size_t i = 0; i < outcomes.size(); ++i) {
    if (const auto* skipped = std::get_if<feed::SkippedItem>(&outcomes[i])) {
      result.set_skipped(result.skipped() + 1);
      result.add_warnings("item " + std::to_string(skipped->index) + " skipped: " + skipped->reason);
      continue;
    }
    const auto& record = std::get<feed::ProductRecord>(outcomes[i]);
    last[record.product_id] = ok.size();
    ok.emplace_back(i, &record);
  }

  std::vector<feed::ProductRecord> records;
  records.reserve(last.size());
  for (size_t n = 0; n < ok.size(); ++n) {
    const auto& [index, record] = ok[n];
    if (last[record->product_id] != n) {
      result.set_skipped(result.skipped() + 1);
      result.add_warnings("item " + std::to_string(index) + " skipped: duplicate product id " + record->product_id +
                          ", a later item wins");
      FRAMECOMP_LOG_WARN("duplicate product id in feed",
                         {StringField("project_id", ctx.task.project_id), StringField("product_id", record->product_id)});
      continue;
    }
    records.push_back(*record);
  }
  return records;
}

void BulkOrchestrator::ProcessItem(RunContext& ctx, const feed::ProductRecord& record) {
  auto&      metrics = observability::Metrics::Instance();
  const auto start   = std::chrono::steady_clock::now();
  metrics.AdjustItemsInFlight(1);

  bool written   = false;
  bool succeeded = false;

  db::model::OutputRecord output;
  output.project_id        = ctx.task.project_id;
  output.product_id        = record.product_id;
  output.product_image_url = record.image_url;

  if (!ctx.cancelled->load()) {
    observability::SpanScope span("bulk.item");
    span.SetAttribute("project_id", ctx.task.project_id);
    span.SetAttribute("product_id", record.product_id);

    try {
      auto response = fetcher_->Fetch(record.image_url, net::ContentKind::kImage);
      auto encoded  = compositor_->Compose(ctx.frame, ctx.rect, response.body);

      auto key = storage::common::OutputKey(ctx.task.project_id, record.product_id, ctx.frame.format);
      if (!ctx.cancelled->load()) {
        blobs_->Write(key, storage::common::ToBuffer(std::move(encoded)));
      }
      output.image_key = std::move(key);
      succeeded        = true;
    } catch (const util::FetchError& e) {
      output.failure_reason = std::string("image fetch failed: ") + e.what();
    } catch (const util::ValidationError& e) {
      output.failure_reason = std::string("image rejected: ") + e.what();
    } catch (const util::CompositeError& e) {
      output.failure_reason = std::string("composite failed: ") + e.what();
    } catch (const std::exception& e) {
      output.failure_reason = std::string("item failed: ") + e.what();
    }

    output.status = succeeded ? v1::OUTPUT_STATUS_SUCCEEDED : v1::OUTPUT_STATUS_FAILED;
    if (!succeeded) {
      span.RecordException(output.failure_reason);
      FRAMECOMP_LOG_WARN("item failed", {StringField("project_id", ctx.task.project_id),
                                         StringField("product_id", record.product_id),
                                         StringField("reason", output.failure_reason)});
    }

    written = WriteOutput(ctx, output);
    if (!written && succeeded && !ctx.cancelled->load()) {
      succeeded             = false;
      output.failure_reason = "output store write failed";
    }
  }

  metrics.AdjustItemsInFlight(-1);
  if (written || !ctx.cancelled->load()) {
    metrics.ObserveItemDurationMs(succeeded ? "succeeded" : "failed", ElapsedMs(start));
  }

  std::lock_guard lock(ctx.mutex);

  if (!ctx.cancelled->load() || written) {
    ctx.result.set_attempted(ctx.result.attempted() + 1);
    if (succeeded) {
      ctx.result.set_succeeded(ctx.result.succeeded() + 1);
    } else {
      ctx.result.set_failed(ctx.result.failed() + 1);
      auto* failure = ctx.result.add_failures();
      failure->set_product_id(record.product_id);
      failure->set_reason(output.failure_reason);
    }
  }

  ++ctx.processed;
  registry_->SetProcessed(ctx.task.project_id, ctx.processed);
  if (options_.progress_interval > 0 && ctx.processed % options_.progress_interval == 0) {
    PersistProgress(ctx, std::nullopt);
  }

  // last touch of ctx: the run thread may return as soon as pending hits zero
  if (--ctx.pending == 0) {
    ctx.idle.notify_all();
  }
}

bool BulkOrchestrator::WriteOutput(RunContext& ctx, const db::model::OutputRecord& output) {
  if (ctx.cancelled->load()) {
    DropBlob(output.image_key);
    return false;
  }

  db::model::OutputRecord row = output;
  row.generated_at_ms         = util::NowMillis();
  row.created_at_ms           = row.generated_at_ms;

  db::Result result;
  try {
    auto tx = repository_->Begin();
    result  = repository_->UpsertOutput(*tx, row);
    if (result) tx->Commit();
  } catch (const std::exception& e) {
    result = db::Result::Err(db::ErrorCode::InternalError, e.what());
  }

  if (result) {
    return true;
  }

  if (result.code == db::ErrorCode::NotFound) {
    // project deleted under us: stop writing
    ctx.cancelled->store(true);
  } else {
    FRAMECOMP_LOG_ERROR("output upsert failed", {StringField("project_id", row.project_id),
                                                 StringField("product_id", row.product_id),
                                                 StringField("error", result.message)});
  }
  // no row references the blob, so it must not outlive this call
  DropBlob(row.image_key);
  return false;
}

void BulkOrchestrator::DropBlob(const std::string& key) {
  if (key.empty()) {
    return;
  }
  try {
    blobs_->Remove(key);
  } catch (const std::exception& e) {
    FRAMECOMP_LOG_WARN("orphaned output blob not removed", {StringField("key", key), StringField("error", e.what())});
  }
}

void BulkOrchestrator::PersistProgress(RunContext& ctx, std::optional<uint64_t> total_items) {
  try {
    auto tx      = repository_->Begin();
    auto project = repository_->GetProject(*tx, ctx.task.project_id);
    if (!project) {
      ctx.cancelled->store(true);
      return;
    }

    if (total_items) {
      project->total_items = *total_items;
    }
    project->succeeded_items = ctx.result.succeeded();
    project->failed_items    = ctx.result.failed();
    project->updated_at_ms   = util::NowMillis();

    auto result = repository_->UpdateProject(*tx, *project);
    if (!result) {
      FRAMECOMP_LOG_WARN("progress not persisted", {StringField("project_id", ctx.task.project_id), StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    FRAMECOMP_LOG_WARN("progress not persisted", {StringField("project_id", ctx.task.project_id), StringField("error", e.what())});
  }
}

void BulkOrchestrator::Abandon(const RunTask& task, const std::string& reason) {
  try {
    auto tx      = repository_->Begin();
    auto project = repository_->GetProject(*tx, task.project_id);
    if (project && project->status == v1::PROJECT_STATUS_PROCESSING) {
      const auto now               = util::NowMillis();
      project->status              = project->rect_set ? v1::PROJECT_STATUS_RECT_SET : v1::PROJECT_STATUS_DRAFT;
      project->last_error          = reason;
      project->run_completed_at_ms = now;
      project->updated_at_ms       = now;

      auto result = repository_->UpdateProject(*tx, *project);
      if (result) {
        tx->Commit();
      } else {
        FRAMECOMP_LOG_ERROR("abandoned run not persisted", {StringField("project_id", task.project_id), StringField("error", result.message)});
      }
    }
  } catch (const std::exception& e) {
    FRAMECOMP_LOG_ERROR("abandoned run not persisted", {StringField("project_id", task.project_id), StringField("error", e.what())});
  }

  registry_->Finish(task.project_id, v1::RUN_STATE_CANCELLED, v1::BulkRunResult{}, reason);
  FRAMECOMP_LOG_WARN("bulk run abandoned", {StringField("project_id", task.project_id),
                                            StringField("run_id", task.run_id),
                                            StringField("reason", reason)});
}

void BulkOrchestrator::FinishProject(RunContext& ctx, v1::RunState state, const std::string& error) {
  if (state == v1::RUN_STATE_CANCELLED) {
    return;
  }

  try {
    auto tx      = repository_->Begin();
    auto project = repository_->GetProject(*tx, ctx.task.project_id);
    if (!project) return;

    const auto now = util::NowMillis();

    project->status              = state == v1::RUN_STATE_COMPLETED ? v1::PROJECT_STATUS_COMPLETED : v1::PROJECT_STATUS_FAILED;
    project->succeeded_items     = ctx.result.succeeded();
    project->failed_items        = ctx.result.failed();
    project->last_error          = error;
    project->run_completed_at_ms = now;
    project->updated_at_ms       = now;

    auto result = repository_->UpdateProject(*tx, *project);
    if (!result) {
      FRAMECOMP_LOG_ERROR("run result not persisted", {StringField("project_id", ctx.task.project_id), StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    FRAMECOMP_LOG_ERROR("run result not persisted", {StringField("project_id", ctx.task.project_id), StringField("error", e.what())});
  }
}

} // namespace framecomp::bulk
