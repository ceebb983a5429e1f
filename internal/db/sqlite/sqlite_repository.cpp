#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/api/query_utils.hpp"
#include "internal/util/time.hpp"

namespace framecomp::db::sqlite {

using framecomp::db::ErrorCode;
using framecomp::db::Result;

namespace {

constexpr const char* kProjectColumns =
    "id,name,owner,template_key,template_width,template_height,template_format,"
    "rect_x,rect_y,rect_width,rect_height,rect_set,feed_url,status,"
    "total_items,succeeded_items,failed_items,last_error,"
    "created_at_ms,updated_at_ms,run_started_at_ms,run_completed_at_ms";

constexpr const char* kOutputColumns =
    "project_id,product_id,product_image_url,status,failure_reason,image_key,created_at_ms,generated_at_ms";

// Finalizes on scope exit.
struct Statement {
    sqlite3_stmt* st = nullptr;

    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
            sqlite3_finalize(st);
            st = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(st); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    explicit operator bool() const { return st != nullptr; }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Binds ?1..?22 in kProjectColumns order.
void BindProject(sqlite3_stmt* st, const model::FrameProjectRecord& r) {
    BindText(st, 1, r.id);
    BindText(st, 2, r.name);
    BindText(st, 3, r.owner);
    BindText(st, 4, r.template_key);
    BindI32(st, 5, static_cast<int>(r.template_width));
    BindI32(st, 6, static_cast<int>(r.template_height));
    BindI32(st, 7, static_cast<int>(r.template_format));
    BindI32(st, 8, static_cast<int>(r.rect_x));
    BindI32(st, 9, static_cast<int>(r.rect_y));
    BindI32(st, 10, static_cast<int>(r.rect_width));
    BindI32(st, 11, static_cast<int>(r.rect_height));
    BindI32(st, 12, r.rect_set ? 1 : 0);
    BindText(st, 13, r.feed_url);
    BindI32(st, 14, static_cast<int>(r.status));
    BindU64(st, 15, r.total_items);
    BindU64(st, 16, r.succeeded_items);
    BindU64(st, 17, r.failed_items);
    BindText(st, 18, r.last_error);
    BindU64(st, 19, r.created_at_ms);
    BindU64(st, 20, r.updated_at_ms);
    BindU64(st, 21, r.run_started_at_ms);
    BindU64(st, 22, r.run_completed_at_ms);
}

model::FrameProjectRecord ReadProject(sqlite3_stmt* st) {
    model::FrameProjectRecord r;
    r.id                  = ColText(st, 0);
    r.name                = ColText(st, 1);
    r.owner               = ColText(st, 2);
    r.template_key        = ColText(st, 3);
    r.template_width      = static_cast<uint32_t>(ColI32(st, 4));
    r.template_height     = static_cast<uint32_t>(ColI32(st, 5));
    r.template_format     = static_cast<framecomp::v1::ImageFormat>(ColI32(st, 6));
    r.rect_x              = static_cast<uint32_t>(ColI32(st, 7));
    r.rect_y              = static_cast<uint32_t>(ColI32(st, 8));
    r.rect_width          = static_cast<uint32_t>(ColI32(st, 9));
    r.rect_height         = static_cast<uint32_t>(ColI32(st, 10));
    r.rect_set            = ColI32(st, 11) != 0;
    r.feed_url            = ColText(st, 12);
    r.status              = static_cast<framecomp::v1::ProjectStatus>(ColI32(st, 13));
    r.total_items         = ColU64(st, 14);
    r.succeeded_items     = ColU64(st, 15);
    r.failed_items        = ColU64(st, 16);
    r.last_error          = ColText(st, 17);
    r.created_at_ms       = ColU64(st, 18);
    r.updated_at_ms       = ColU64(st, 19);
    r.run_started_at_ms   = ColU64(st, 20);
    r.run_completed_at_ms = ColU64(st, 21);
    return r;
}

model::OutputRecord ReadOutput(sqlite3_stmt* st) {
    model::OutputRecord r;
    r.project_id        = ColText(st, 0);
    r.product_id        = ColText(st, 1);
    r.product_image_url = ColText(st, 2);
    r.status            = static_cast<framecomp::v1::OutputStatus>(ColI32(st, 3));
    r.failure_reason    = ColText(st, 4);
    r.image_key         = ColText(st, 5);
    r.created_at_ms     = ColU64(st, 6);
    r.generated_at_ms   = ColU64(st, 7);
    return r;
}

uint64_t CountRows(sqlite3* db, const std::string& sql, const std::string& project_id, const std::string* pattern) {
    Statement stmt(db, sql);
    if (!stmt) return 0;

    BindText(stmt.st, 1, project_id);
    if (pattern) BindText(stmt.st, 2, *pattern);

    if (sqlite3_step(stmt.st) != SQLITE_ROW) return 0;
    return ColU64(stmt.st, 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

Result SqliteRepository::Ping() {
    Statement stmt(db_->Handle(), "SELECT 1;");
    if (!stmt) return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db_->Handle()));
    return Translate(db_->Handle(), sqlite3_step(stmt.st));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Frame projects
// ------------------------------------------------------------------

Result SqliteRepository::InsertProject(Transaction& t, const model::FrameProjectRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt(db, std::string("INSERT INTO frame_projects(") + kProjectColumns +
                           ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19,?20,?21,?22);");
    if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindProject(stmt.st, r);
    int rc = sqlite3_step(stmt.st);
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "project exists: " + r.id);

    return Translate(db, rc);
}

std::optional<model::FrameProjectRecord>
SqliteRepository::GetProject(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement stmt(db, std::string("SELECT ") + kProjectColumns + " FROM frame_projects WHERE id=?;");
    if (!stmt) return std::nullopt;

    BindText(stmt.st, 1, id);
    if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;

    return ReadProject(stmt.st);
}

std::vector<model::FrameProjectRecord>
SqliteRepository::ListProjects(Transaction& t, const std::string& owner) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kProjectColumns + " FROM frame_projects";
    if (!owner.empty()) sql += " WHERE owner=?";
    sql += " ORDER BY created_at_ms DESC, id ASC;";

    std::vector<model::FrameProjectRecord> out;
    Statement stmt(db, sql);
    if (!stmt) return out;

    if (!owner.empty()) BindText(stmt.st, 1, owner);
    while (sqlite3_step(stmt.st) == SQLITE_ROW) {
        out.push_back(ReadProject(stmt.st));
    }
    return out;
}

Result SqliteRepository::UpdateProject(Transaction& t, const model::FrameProjectRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt(db,
        "UPDATE frame_projects SET name=?2,owner=?3,template_key=?4,template_width=?5,template_height=?6,template_format=?7,"
        "rect_x=?8,rect_y=?9,rect_width=?10,rect_height=?11,rect_set=?12,feed_url=?13,status=?14,"
        "total_items=?15,succeeded_items=?16,failed_items=?17,last_error=?18,"
        "created_at_ms=?19,updated_at_ms=?20,run_started_at_ms=?21,run_completed_at_ms=?22 WHERE id=?1;");
    if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindProject(stmt.st, r);
    int rc = sqlite3_step(stmt.st);
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "project not found: " + r.id);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteProject(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    // frame_outputs rows go with it through ON DELETE CASCADE
    Statement stmt(db, "DELETE FROM frame_projects WHERE id=?;");
    if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, id);
    return Translate(db, sqlite3_step(stmt.st));
}

// ------------------------------------------------------------------
// Outputs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertOutput(Transaction& t, const model::OutputRecord& r) {
    auto* db = TX(t).Handle();

    {
        Statement exists(db, "SELECT 1 FROM frame_projects WHERE id=?;");
        if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(exists.st, 1, r.project_id);
        if (sqlite3_step(exists.st) != SQLITE_ROW)
            return Result::Err(ErrorCode::NotFound, "project not found: " + r.project_id);
    }

    const uint64_t generated = r.generated_at_ms ? r.generated_at_ms : util::NowMillis();
    const uint64_t created   = r.created_at_ms ? r.created_at_ms : generated;

    Statement stmt(db, std::string("INSERT INTO frame_outputs(") + kOutputColumns +
                           ") VALUES(?,?,?,?,?,?,?,?) "
                           "ON CONFLICT(project_id, product_id) DO UPDATE SET "
                           "product_image_url=excluded.product_image_url, status=excluded.status, "
                           "failure_reason=excluded.failure_reason, image_key=excluded.image_key, "
                           "generated_at_ms=excluded.generated_at_ms;");
    if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.project_id);
    BindText(stmt.st, 2, r.product_id);
    BindText(stmt.st, 3, r.product_image_url);
    BindI32(stmt.st, 4, static_cast<int>(r.status));
    BindText(stmt.st, 5, r.failure_reason);
    BindText(stmt.st, 6, r.image_key);
    BindU64(stmt.st, 7, created);
    BindU64(stmt.st, 8, generated);

    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::OutputRecord>
SqliteRepository::GetOutput(Transaction& t, const std::string& project_id, const std::string& product_id) {
    auto* db = TX(t).Handle();

    Statement stmt(db, std::string("SELECT ") + kOutputColumns + " FROM frame_outputs WHERE project_id=? AND product_id=?;");
    if (!stmt) return std::nullopt;

    BindText(stmt.st, 1, project_id);
    BindText(stmt.st, 2, product_id);
    if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;

    return ReadOutput(stmt.st);
}

model::OutputPage SqliteRepository::PageOutputs(Transaction& t, const model::OutputQuery& q) {
    auto* db = TX(t).Handle();
    model::OutputPage page;

    const auto pattern = ContainsPattern(q.search);
    page.total    = CountRows(db, "SELECT COUNT(*) FROM frame_outputs WHERE project_id=?;", q.project_id, nullptr);
    page.filtered = q.search.empty()
                        ? page.total
                        : CountRows(db, "SELECT COUNT(*) FROM frame_outputs WHERE project_id=? AND product_id LIKE ? ESCAPE '\\';",
                                    q.project_id, &pattern);

    Statement stmt(db, std::string("SELECT ") + kOutputColumns +
                           " FROM frame_outputs WHERE project_id=? AND product_id LIKE ? ESCAPE '\\' "
                           "ORDER BY generated_at_ms DESC, product_id ASC LIMIT ? OFFSET ?;");
    if (!stmt) return page;

    BindText(stmt.st, 1, q.project_id);
    BindText(stmt.st, 2, pattern);
    BindU64(stmt.st, 3, q.limit);
    sqlite3_bind_int64(stmt.st, 4, ClampPageOffset(q.offset));
    while (sqlite3_step(stmt.st) == SQLITE_ROW) {
        page.rows.push_back(ReadOutput(stmt.st));
    }
    return page;
}

model::OutputCounts SqliteRepository::CountOutputs(Transaction& t, const std::string& project_id) {
    auto* db = TX(t).Handle();
    model::OutputCounts counts;

    std::string sql = "SELECT status, COUNT(*) FROM frame_outputs";
    if (!project_id.empty()) sql += " WHERE project_id=?";
    sql += " GROUP BY status;";

    Statement stmt(db, sql);
    if (!stmt) return counts;

    if (!project_id.empty()) BindText(stmt.st, 1, project_id);
    while (sqlite3_step(stmt.st) == SQLITE_ROW) {
        const auto status = static_cast<framecomp::v1::OutputStatus>(ColI32(stmt.st, 0));
        const auto n      = ColU64(stmt.st, 1);
        counts.total += n;
        if (status == framecomp::v1::OUTPUT_STATUS_SUCCEEDED) counts.succeeded += n;
        if (status == framecomp::v1::OUTPUT_STATUS_FAILED) counts.failed += n;
    }
    return counts;
}

} // namespace framecomp::db::sqlite
