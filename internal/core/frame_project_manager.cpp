#include "frame_project_manager.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>

#include "internal/db/api/query_utils.hpp"
#include "internal/image/image_codec.hpp"
#include "internal/net/url.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace framecomp::core {

using namespace framecomp::v1;
using observability::StringField;

namespace {

constexpr size_t kMaxProjectNameLength = 200;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::ValidationError(message);
    default:
      throw std::runtime_error(message);
  }
}

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

} // namespace

FrameProject ToProto(const db::model::FrameProjectRecord& record) {
  FrameProject project;
  project.set_id(record.id);
  project.set_name(record.name);
  project.set_owner(record.owner);
  project.set_template_width(record.template_width);
  project.set_template_height(record.template_height);
  project.set_template_format(record.template_format);
  if (record.rect_set) {
    auto* rect = project.mutable_rect();
    rect->set_x(record.rect_x);
    rect->set_y(record.rect_y);
    rect->set_width(record.rect_width);
    rect->set_height(record.rect_height);
  }
  project.set_rect_set(record.rect_set);
  project.set_feed_url(record.feed_url);
  project.set_status(record.status);
  project.set_total_items(record.total_items);
  project.set_succeeded_items(record.succeeded_items);
  project.set_failed_items(record.failed_items);

  const uint64_t processed = record.succeeded_items + record.failed_items;
  project.set_progress_percentage(record.total_items == 0 ? 0.0 : 100.0 * static_cast<double>(processed) / record.total_items);
  project.set_success_rate(processed == 0 ? 0.0 : 100.0 * static_cast<double>(record.succeeded_items) / processed);

  project.set_last_error(record.last_error);
  *project.mutable_created_at()       = util::MillisToProto(record.created_at_ms);
  *project.mutable_updated_at()       = util::MillisToProto(record.updated_at_ms);
  *project.mutable_run_started_at()   = util::MillisToProto(record.run_started_at_ms);
  *project.mutable_run_completed_at() = util::MillisToProto(record.run_completed_at_ms);
  return project;
}

Output ToProto(const db::model::OutputRecord& record) {
  Output output;
  output.set_project_id(record.project_id);
  output.set_product_id(record.product_id);
  output.set_product_image_url(record.product_image_url);
  output.set_status(record.status);
  output.set_failure_reason(record.failure_reason);
  output.set_image_key(record.image_key);
  *output.mutable_created_at()   = util::MillisToProto(record.created_at_ms);
  *output.mutable_generated_at() = util::MillisToProto(record.generated_at_ms);
  return output;
}

FrameProjectManager::FrameProjectManager(std::shared_ptr<db::Repository>         repository,
                                         storage::BlobStorePtr                   blobs,
                                         std::shared_ptr<preview::PreviewEngine> preview,
                                         std::shared_ptr<bulk::RunQueue>         queue,
                                         std::shared_ptr<bulk::RunRegistry>      registry,
                                         image::CompositorOptions                compositor_options)
    : repository_(std::move(repository)),
      blobs_(std::move(blobs)),
      preview_(std::move(preview)),
      queue_(std::move(queue)),
      registry_(std::move(registry)),
      compositor_options_(compositor_options) {
}

db::model::FrameProjectRecord FrameProjectManager::LoadProject(db::Transaction& tx, const std::string& project_id) {
  auto project = repository_->GetProject(tx, project_id);
  if (!project) {
    throw util::NotFound("frame project not found: " + project_id);
  }
  return *project;
}

image::FrameTemplate FrameProjectManager::LoadFrame(const db::model::FrameProjectRecord& project) {
  std::shared_ptr<arrow::Buffer> buffer;
  try {
    buffer = blobs_->Read(project.template_key);
  } catch (const util::NotFound&) {
    throw util::ConfigurationError("template image missing for project " + project.id);
  }
  return image::DecodeTemplate(storage::common::ToString(buffer));
}

FrameProject FrameProjectManager::CreateProject(const std::string& name, const std::string& owner, const std::string& template_image,
                                                const std::string& feed_url) {
  const auto trimmed_name = Trim(name);
  if (trimmed_name.empty()) {
    throw util::ValidationError("project name is required");
  }
  if (trimmed_name.size() > kMaxProjectNameLength) {
    throw util::ValidationError("project name exceeds " + std::to_string(kMaxProjectNameLength) + " characters");
  }

  const auto trimmed_feed = Trim(feed_url);
  if (!trimmed_feed.empty()) {
    if (!net::HasHttpScheme(trimmed_feed)) {
      throw util::ValidationError("feed url must use http or https");
    }
    net::ParseUrl(trimmed_feed);
  }

  auto frame = image::LoadTemplate(template_image, compositor_options_);

  const auto now = util::NowMillis();

  db::model::FrameProjectRecord record;
  record.id              = util::GenerateUUIDString();
  record.name            = trimmed_name;
  record.owner           = owner;
  record.template_key    = storage::common::TemplateKey(record.id, frame.format);
  record.template_width  = frame.Width();
  record.template_height = frame.Height();
  record.template_format = frame.format;
  record.feed_url        = trimmed_feed;
  record.status          = PROJECT_STATUS_DRAFT;
  record.created_at_ms   = now;
  record.updated_at_ms   = now;

  std::shared_lock template_lock(template_mutex_);
  blobs_->Write(record.template_key, storage::common::ToBuffer(template_image));

  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertProject(*tx, record), "insert frame project");
    tx->Commit();
  } catch (...) {
    blobs_->Remove(record.template_key);
    throw;
  }

  FRAMECOMP_LOG_INFO("frame project created", {StringField("project_id", record.id),
                                               StringField("name", record.name),
                                               StringField("format", ImageFormat_Name(record.template_format))});
  return ToProto(record);
}

FrameProject FrameProjectManager::GetProject(const std::string& project_id) {
  auto tx      = repository_->Begin();
  auto project = LoadProject(*tx, project_id);
  tx->Commit();
  return ToProto(project);
}

std::vector<FrameProject> FrameProjectManager::ListProjects(const std::string& owner) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListProjects(*tx, owner);
  tx->Commit();

  std::vector<FrameProject> projects;
  projects.reserve(records.size());
  for (const auto& record : records) projects.push_back(ToProto(record));
  return projects;
}

FrameProject FrameProjectManager::SetOverlayRect(const std::string& project_id, const OverlayRect& rect) {
  auto tx      = repository_->Begin();
  auto project = LoadProject(*tx, project_id);

  image::ValidateRect(image::OverlayRect{rect.x(), rect.y(), rect.width(), rect.height()}, project.template_width,
                      project.template_height);

  project.rect_x      = rect.x();
  project.rect_y      = rect.y();
  project.rect_width  = rect.width();
  project.rect_height = rect.height();
  project.rect_set    = true;
  // an active run keeps its snapshot and its status
  if (project.status != PROJECT_STATUS_PROCESSING) {
    project.status = PROJECT_STATUS_RECT_SET;
  }
  project.updated_at_ms = util::NowMillis();

  ThrowIfDbError(repository_->UpdateProject(*tx, project), "update overlay rect");
  tx->Commit();
  return ToProto(project);
}

preview::PreviewImage FrameProjectManager::GeneratePreview(const std::string& project_id, const std::optional<OverlayRect>& rect,
                                                           const std::optional<preview::ProductImageRef>& product_image) {
  db::model::FrameProjectRecord project;
  {
    auto tx = repository_->Begin();
    project = LoadProject(*tx, project_id);
    tx->Commit();
  }

  image::OverlayRect area;
  if (rect) {
    area = image::OverlayRect{rect->x(), rect->y(), rect->width(), rect->height()};
  } else if (project.rect_set) {
    area = image::OverlayRect{project.rect_x, project.rect_y, project.rect_width, project.rect_height};
  } else {
    throw util::ConfigurationError("no overlay rect given and none saved on the project");
  }
  image::ValidateRect(area, project.template_width, project.template_height);

  auto frame = LoadFrame(project);
  auto ref   = product_image ? *product_image : preview::ProductImageRef{preview::FromFeed{project.feed_url}};
  return preview_->Render(frame, area, ref);
}

RunHandle FrameProjectManager::TriggerBulkRun(const std::string& project_id) {
  {
    auto tx      = repository_->Begin();
    auto project = LoadProject(*tx, project_id);
    tx->Commit();

    if (!project.rect_set) {
      throw util::ConfigurationError("set the overlay rect before starting a bulk run");
    }
    if (project.feed_url.empty()) {
      throw util::ConfigurationError("frame project has no feed url");
    }
  }
  if (!queue_->IsAccepting()) {
    throw std::runtime_error("run queue is not accepting runs");
  }

  auto handle = registry_->Reserve(project_id);

  try {
    auto tx      = repository_->Begin();
    auto project = LoadProject(*tx, project_id);

    const auto now              = util::NowMillis();
    project.status              = PROJECT_STATUS_PROCESSING;
    project.total_items         = 0;
    project.succeeded_items     = 0;
    project.failed_items        = 0;
    project.last_error.clear();
    project.run_started_at_ms   = now;
    project.run_completed_at_ms = 0;
    project.updated_at_ms       = now;

    ThrowIfDbError(repository_->UpdateProject(*tx, project), "mark project processing");
    tx->Commit();
  } catch (const std::exception& e) {
    registry_->Finish(project_id, RUN_STATE_FAILED, BulkRunResult{}, e.what());
    throw;
  }

  if (!queue_->Enqueue(bulk::RunTask{handle.run_id(), project_id})) {
    const std::string error = "run queue is not accepting runs";
    registry_->Finish(project_id, RUN_STATE_FAILED, BulkRunResult{}, error);
    throw std::runtime_error(error);
  }

  FRAMECOMP_LOG_INFO("bulk run queued", {StringField("project_id", project_id), StringField("run_id", handle.run_id())});
  return handle;
}

RunStatus FrameProjectManager::GetRunStatus(const std::string& project_id) {
  if (auto status = registry_->Get(project_id)) {
    return *status;
  }

  // nothing in this process; report what the project row remembers
  auto tx      = repository_->Begin();
  auto project = LoadProject(*tx, project_id);
  tx->Commit();

  RunStatus status;
  status.mutable_handle()->set_project_id(project_id);
  switch (project.status) {
    case PROJECT_STATUS_COMPLETED:
      status.set_state(RUN_STATE_COMPLETED);
      break;
    case PROJECT_STATUS_FAILED:
      status.set_state(RUN_STATE_FAILED);
      break;
    default:
      status.set_state(RUN_STATE_UNSPECIFIED);
      break;
  }
  status.set_total_items(project.total_items);
  status.set_processed(project.succeeded_items + project.failed_items);
  status.mutable_result()->set_attempted(project.succeeded_items + project.failed_items);
  status.mutable_result()->set_succeeded(project.succeeded_items);
  status.mutable_result()->set_failed(project.failed_items);
  status.set_error(project.last_error);
  *status.mutable_started_at()   = util::MillisToProto(project.run_started_at_ms);
  *status.mutable_completed_at() = util::MillisToProto(project.run_completed_at_ms);
  return status;
}

ListOutputsResponse FrameProjectManager::ListOutputs(const std::string& project_id, const std::string& search, uint64_t offset,
                                                     uint32_t limit) {
  auto tx = repository_->Begin();
  LoadProject(*tx, project_id);

  db::model::OutputQuery query;
  query.project_id = project_id;
  query.search     = Trim(search);
  query.offset     = offset;
  query.limit      = db::ClampPageLimit(limit);

  auto page = repository_->PageOutputs(*tx, query);
  tx->Commit();

  ListOutputsResponse resp;
  resp.set_total(page.total);
  resp.set_filtered(page.filtered);
  for (const auto& row : page.rows) {
    *resp.add_rows() = ToProto(row);
  }
  return resp;
}

GetOutputImageResponse FrameProjectManager::GetOutputImage(const std::string& project_id, const std::string& product_id) {
  auto tx     = repository_->Begin();
  auto output = repository_->GetOutput(*tx, project_id, product_id);
  tx->Commit();

  if (!output) {
    throw util::NotFound("output not found: " + project_id + "/" + product_id);
  }
  if (output->status != OUTPUT_STATUS_SUCCEEDED || output->image_key.empty()) {
    throw util::NotFound("output has no image: " + output->failure_reason);
  }

  GetOutputImageResponse resp;
  resp.set_image(storage::common::ToString(blobs_->Read(output->image_key)));
  resp.set_mime_type(image::MimeType(image::DetectFormat(resp.image())));
  return resp;
}

void FrameProjectManager::DeleteProject(const std::string& project_id) {
  const bool cancelled = registry_->Cancel(project_id);

  db::model::FrameProjectRecord project;
  {
    auto tx = repository_->Begin();
    project = LoadProject(*tx, project_id);
    ThrowIfDbError(repository_->DeleteProject(*tx, project_id), "delete frame project");
    tx->Commit();
  }
  registry_->Forget(project_id);

  try {
    blobs_->Remove(project.template_key);
    blobs_->RemovePrefix(storage::common::OutputPrefix(project_id));
  } catch (const std::exception& e) {
    FRAMECOMP_LOG_WARN("project blobs not fully removed", {StringField("project_id", project_id), StringField("error", e.what())});
  }

  FRAMECOMP_LOG_INFO("frame project deleted",
                     {StringField("project_id", project_id), observability::BoolField("run_cancelled", cancelled)});
}

StatsResponse FrameProjectManager::Stats() {
  auto tx       = repository_->Begin();
  auto projects = repository_->ListProjects(*tx, "");
  auto counts   = repository_->CountOutputs(*tx, "");
  tx->Commit();

  StatsResponse resp;
  for (const auto& project : projects) {
    switch (project.status) {
      case PROJECT_STATUS_DRAFT:
        resp.set_projects_draft(resp.projects_draft() + 1);
        break;
      case PROJECT_STATUS_RECT_SET:
        resp.set_projects_rect_set(resp.projects_rect_set() + 1);
        break;
      case PROJECT_STATUS_PROCESSING:
        resp.set_projects_processing(resp.projects_processing() + 1);
        break;
      case PROJECT_STATUS_COMPLETED:
        resp.set_projects_completed(resp.projects_completed() + 1);
        break;
      case PROJECT_STATUS_FAILED:
        resp.set_projects_failed(resp.projects_failed() + 1);
        break;
      default:
        break;
    }
  }
  resp.set_outputs_total(counts.total);
  resp.set_outputs_succeeded(counts.succeeded);
  resp.set_outputs_failed(counts.failed);
  resp.set_active_runs(registry_->ActiveCount());
  return resp;
}

std::vector<std::string> FrameProjectManager::ReferencedOutputKeys(const std::string& project_id) {
  std::vector<std::string> keys;

  db::model::OutputQuery query;
  query.project_id = project_id;
  query.limit      = db::kMaxPageLimit;

  auto tx = repository_->Begin();
  while (true) {
    auto page = repository_->PageOutputs(*tx, query);
    for (auto& row : page.rows) {
      if (!row.image_key.empty()) keys.push_back(std::move(row.image_key));
    }
    if (page.rows.size() < query.limit) break;
    query.offset += page.rows.size();
  }
  tx->Commit();

  std::sort(keys.begin(), keys.end());
  return keys;
}

CleanupResponse FrameProjectManager::CleanupOrphanedFiles(bool dry_run) {
  CleanupResponse resp;
  resp.set_dry_run(dry_run);

  auto drop = [&](const std::string& key) {
    resp.add_keys(key);
    if (!dry_run) blobs_->Remove(key);
  };

  // Keys are listed before the projects are read, so a project created
  // after the listing never has blobs in it.
  std::unique_lock template_lock(template_mutex_);
  const auto template_keys = blobs_->List("templates/");
  const auto output_keys   = blobs_->List("outputs/");

  std::map<std::string, db::model::FrameProjectRecord> projects;
  {
    auto tx = repository_->Begin();
    for (auto& project : repository_->ListProjects(*tx, "")) {
      projects.emplace(project.id, std::move(project));
    }
    tx->Commit();
  }

  std::set<std::string> live_templates;
  for (const auto& [id, project] : projects) live_templates.insert(project.template_key);
  for (const auto& key : template_keys) {
    if (live_templates.count(key) != 0) continue;
    resp.set_orphaned_templates(resp.orphaned_templates() + 1);
    drop(key);
  }
  template_lock.unlock();

  // outputs/<project_id>/<file>
  const std::string root = "outputs/";
  std::map<std::string, std::vector<std::string>> by_project;
  for (const auto& key : output_keys) {
    const auto slash = key.find('/', root.size());
    if (slash == std::string::npos) continue;
    by_project[key.substr(root.size(), slash - root.size())].push_back(key);
  }

  for (const auto& [project_id, keys] : by_project) {
    if (projects.count(project_id) == 0) {
      resp.set_orphaned_output_dirs(resp.orphaned_output_dirs() + 1);
      resp.set_orphaned_outputs(resp.orphaned_outputs() + keys.size());
      for (const auto& key : keys) resp.add_keys(key);
      if (!dry_run) blobs_->RemovePrefix(storage::common::OutputPrefix(project_id));
      continue;
    }

    // a running project writes each blob before its row
    if (registry_->IsActive(project_id)) continue;
    const auto referenced = ReferencedOutputKeys(project_id);
    if (registry_->IsActive(project_id)) continue;

    for (const auto& key : keys) {
      if (std::binary_search(referenced.begin(), referenced.end(), key)) continue;
      resp.set_orphaned_outputs(resp.orphaned_outputs() + 1);
      drop(key);
    }
  }

  FRAMECOMP_LOG_INFO("orphaned files cleaned",
                     {observability::BoolField("dry_run", dry_run),
                      observability::IntField("output_dirs", static_cast<int64_t>(resp.orphaned_output_dirs())),
                      observability::IntField("outputs", static_cast<int64_t>(resp.orphaned_outputs())),
                      observability::IntField("templates", static_cast<int64_t>(resp.orphaned_templates()))});
  return resp;
}

uint64_t FrameProjectManager::RecoverInterruptedRuns() {
  uint64_t recovered = 0;

  auto tx = repository_->Begin();
  for (auto project : repository_->ListProjects(*tx, "")) {
    if (project.status != PROJECT_STATUS_PROCESSING) continue;

    project.status              = PROJECT_STATUS_FAILED;
    project.last_error          = "run interrupted by a service restart";
    project.updated_at_ms       = util::NowMillis();
    project.run_completed_at_ms = project.updated_at_ms;
    ThrowIfDbError(repository_->UpdateProject(*tx, project), "recover frame project " + project.id);
    ++recovered;
  }
  tx->Commit();

  if (recovered > 0) {
    FRAMECOMP_LOG_WARN("interrupted runs marked failed", {observability::IntField("projects", static_cast<int64_t>(recovered))});
  }
  return recovered;
}

} // namespace framecomp::core
