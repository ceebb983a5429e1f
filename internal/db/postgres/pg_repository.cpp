#include "pg_repository.hpp"

#include "internal/db/api/query_utils.hpp"
#include "internal/util/time.hpp"

namespace framecomp::db::postgres {

namespace {

model::FrameProjectRecord ReadProject(const pqxx::row& row) {
  model::FrameProjectRecord r;
  r.id                  = row[0].c_str();
  r.name                = row[1].c_str();
  r.owner               = row[2].c_str();
  r.template_key        = row[3].c_str();
  r.template_width      = row[4].as<uint32_t>();
  r.template_height     = row[5].as<uint32_t>();
  r.template_format     = static_cast<framecomp::v1::ImageFormat>(row[6].as<int>());
  r.rect_x              = row[7].as<uint32_t>();
  r.rect_y              = row[8].as<uint32_t>();
  r.rect_width          = row[9].as<uint32_t>();
  r.rect_height         = row[10].as<uint32_t>();
  r.rect_set            = row[11].as<bool>();
  r.feed_url            = row[12].c_str();
  r.status              = static_cast<framecomp::v1::ProjectStatus>(row[13].as<int>());
  r.total_items         = row[14].as<uint64_t>();
  r.succeeded_items     = row[15].as<uint64_t>();
  r.failed_items        = row[16].as<uint64_t>();
  r.last_error          = row[17].c_str();
  r.created_at_ms       = row[18].as<uint64_t>();
  r.updated_at_ms       = row[19].as<uint64_t>();
  r.run_started_at_ms   = row[20].as<uint64_t>();
  r.run_completed_at_ms = row[21].as<uint64_t>();
  return r;
}

model::OutputRecord ReadOutput(const pqxx::row& row) {
  model::OutputRecord r;
  r.project_id        = row[0].c_str();
  r.product_id        = row[1].c_str();
  r.product_image_url = row[2].c_str();
  r.status            = static_cast<framecomp::v1::OutputStatus>(row[3].as<int>());
  r.failure_reason    = row[4].c_str();
  r.image_key         = row[5].c_str();
  r.created_at_ms     = row[6].as<uint64_t>();
  r.generated_at_ms   = row[7].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

Result PgRepository::Ping() {
  try {
    auto           conn = pool_->Acquire();
    pqxx::nontransaction tx(*conn);
    tx.exec("SELECT 1");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) return Result::Err(ErrorCode::NotFound, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertProject(Transaction& t, const model::FrameProjectRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_project", r.id, r.name, r.owner, r.template_key, r.template_width, r.template_height,
                               (int)r.template_format, r.rect_x, r.rect_y, r.rect_width, r.rect_height, r.rect_set, r.feed_url,
                               (int)r.status, r.total_items, r.succeeded_items, r.failed_items, r.last_error, r.created_at_ms,
                               r.updated_at_ms, r.run_started_at_ms, r.run_completed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FrameProjectRecord> PgRepository::GetProject(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_project", id);
  if (res.empty()) return std::nullopt;
  return ReadProject(res[0]);
}

std::vector<model::FrameProjectRecord> PgRepository::ListProjects(Transaction& t, const std::string& owner) {
  auto res = owner.empty() ? TX(t).Work().exec_prepared("list_projects") : TX(t).Work().exec_prepared("list_projects_by_owner", owner);

  std::vector<model::FrameProjectRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadProject(row));
  }
  return records;
}

Result PgRepository::UpdateProject(Transaction& t, const model::FrameProjectRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_project", r.id, r.name, r.owner, r.template_key, r.template_width, r.template_height,
                                          (int)r.template_format, r.rect_x, r.rect_y, r.rect_width, r.rect_height, r.rect_set,
                                          r.feed_url, (int)r.status, r.total_items, r.succeeded_items, r.failed_items, r.last_error,
                                          r.created_at_ms, r.updated_at_ms, r.run_started_at_ms, r.run_completed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "project not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteProject(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_project", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertOutput(Transaction& t, const model::OutputRecord& r) {
  try {
    auto& work = TX(t).Work();
    // FOR SHARE keeps a concurrent project delete from slipping in between
    if (work.exec_prepared("lock_project", r.project_id).empty()) {
      return Result::Err(ErrorCode::NotFound, "project not found: " + r.project_id);
    }

    const uint64_t generated = r.generated_at_ms ? r.generated_at_ms : util::NowMillis();
    const uint64_t created   = r.created_at_ms ? r.created_at_ms : generated;
    work.exec_prepared("upsert_output", r.project_id, r.product_id, r.product_image_url, (int)r.status, r.failure_reason, r.image_key,
                       created, generated);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OutputRecord> PgRepository::GetOutput(Transaction& t, const std::string& project_id, const std::string& product_id) {
  auto res = TX(t).Work().exec_prepared("get_output", project_id, product_id);
  if (res.empty()) return std::nullopt;
  return ReadOutput(res[0]);
}

model::OutputPage PgRepository::PageOutputs(Transaction& t, const model::OutputQuery& q) {
  auto&             work    = TX(t).Work();
  const auto        pattern = ContainsPattern(q.search);
  model::OutputPage page;

  page.total    = work.exec_prepared("count_outputs", q.project_id)[0][0].as<uint64_t>();
  page.filtered = q.search.empty() ? page.total : work.exec_prepared("count_outputs_matching", q.project_id, pattern)[0][0].as<uint64_t>();

  auto res = work.exec_prepared("page_outputs", q.project_id, pattern, q.limit, ClampPageOffset(q.offset));
  page.rows.reserve(res.size());
  for (const auto& row : res) {
    page.rows.push_back(ReadOutput(row));
  }
  return page;
}

model::OutputCounts PgRepository::CountOutputs(Transaction& t, const std::string& project_id) {
  auto res = project_id.empty() ? TX(t).Work().exec_prepared("output_status_counts")
                                : TX(t).Work().exec_prepared("output_status_counts_by_project", project_id);

  model::OutputCounts counts;
  for (const auto& row : res) {
    const auto status = static_cast<framecomp::v1::OutputStatus>(row[0].as<int>());
    const auto n      = row[1].as<uint64_t>();
    counts.total += n;
    if (status == framecomp::v1::OUTPUT_STATUS_SUCCEEDED) counts.succeeded += n;
    if (status == framecomp::v1::OUTPUT_STATUS_FAILED) counts.failed += n;
  }
  return counts;
}

} // namespace framecomp::db::postgres
