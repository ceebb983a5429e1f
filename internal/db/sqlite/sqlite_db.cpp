#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace framecomp::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets readers proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; outputs cascade on project delete
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS frame_projects ("
      "id TEXT PRIMARY KEY, name TEXT NOT NULL, owner TEXT NOT NULL DEFAULT '', "
      "template_key TEXT NOT NULL, template_width INTEGER NOT NULL, template_height INTEGER NOT NULL, template_format INTEGER NOT NULL, "
      "rect_x INTEGER NOT NULL DEFAULT 0, rect_y INTEGER NOT NULL DEFAULT 0, rect_width INTEGER NOT NULL DEFAULT 0, rect_height INTEGER NOT NULL DEFAULT 0, "
      "rect_set INTEGER NOT NULL DEFAULT 0, feed_url TEXT NOT NULL DEFAULT '', status INTEGER NOT NULL, "
      "total_items INTEGER NOT NULL DEFAULT 0, succeeded_items INTEGER NOT NULL DEFAULT 0, failed_items INTEGER NOT NULL DEFAULT 0, "
      "last_error TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "run_started_at_ms INTEGER NOT NULL DEFAULT 0, run_completed_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS frame_projects_owner_idx ON frame_projects(owner, created_at_ms DESC);",
      "CREATE TABLE IF NOT EXISTS frame_outputs ("
      "project_id TEXT NOT NULL REFERENCES frame_projects(id) ON DELETE CASCADE, product_id TEXT NOT NULL, "
      "product_image_url TEXT NOT NULL DEFAULT '', status INTEGER NOT NULL, failure_reason TEXT NOT NULL DEFAULT '', "
      "image_key TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, generated_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (project_id, product_id));",
      "CREATE INDEX IF NOT EXISTS frame_outputs_recent_idx ON frame_outputs(project_id, generated_at_ms DESC);"};

  std::scoped_lock lock(tx_mutex_);
  for (const auto& sql : kSchema) {
    Exec(sql);
  }
}

} // namespace framecomp::db::sqlite
