#include "pg_pool.hpp"

namespace framecomp::db::postgres {

namespace {

const std::string kProjectColumns =
    "id,name,owner,template_key,template_width,template_height,template_format,"
    "rect_x,rect_y,rect_width,rect_height,rect_set,feed_url,status,"
    "total_items,succeeded_items,failed_items,last_error,"
    "created_at_ms,updated_at_ms,run_started_at_ms,run_completed_at_ms";

const std::string kOutputColumns =
    "project_id,product_id,product_image_url,status,failure_reason,image_key,created_at_ms,generated_at_ms";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::BootstrapSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS frame_projects ("
      "id TEXT PRIMARY KEY, name TEXT NOT NULL, owner TEXT NOT NULL DEFAULT '', "
      "template_key TEXT NOT NULL, template_width INTEGER NOT NULL, template_height INTEGER NOT NULL, template_format SMALLINT NOT NULL, "
      "rect_x INTEGER NOT NULL DEFAULT 0, rect_y INTEGER NOT NULL DEFAULT 0, rect_width INTEGER NOT NULL DEFAULT 0, rect_height INTEGER NOT NULL DEFAULT 0, "
      "rect_set BOOLEAN NOT NULL DEFAULT FALSE, feed_url TEXT NOT NULL DEFAULT '', status SMALLINT NOT NULL, "
      "total_items BIGINT NOT NULL DEFAULT 0, succeeded_items BIGINT NOT NULL DEFAULT 0, failed_items BIGINT NOT NULL DEFAULT 0, "
      "last_error TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, "
      "run_started_at_ms BIGINT NOT NULL DEFAULT 0, run_completed_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS frame_projects_owner_idx ON frame_projects(owner, created_at_ms DESC);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS frame_outputs ("
      "project_id TEXT NOT NULL REFERENCES frame_projects(id) ON DELETE CASCADE, product_id TEXT NOT NULL, "
      "product_image_url TEXT NOT NULL DEFAULT '', status SMALLINT NOT NULL, failure_reason TEXT NOT NULL DEFAULT '', "
      "image_key TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, generated_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY (project_id, product_id));");
  tx.exec("CREATE INDEX IF NOT EXISTS frame_outputs_recent_idx ON frame_outputs(project_id, generated_at_ms DESC);");
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_project", "SELECT " + kProjectColumns + " FROM frame_projects WHERE id=$1");

  conn.prepare("insert_project", "INSERT INTO frame_projects(" + kProjectColumns +
                                     ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21,$22)");

  conn.prepare("update_project",
               "UPDATE frame_projects SET name=$2,owner=$3,template_key=$4,template_width=$5,template_height=$6,template_format=$7,"
               "rect_x=$8,rect_y=$9,rect_width=$10,rect_height=$11,rect_set=$12,feed_url=$13,status=$14,"
               "total_items=$15,succeeded_items=$16,failed_items=$17,last_error=$18,"
               "created_at_ms=$19,updated_at_ms=$20,run_started_at_ms=$21,run_completed_at_ms=$22 WHERE id=$1");

  conn.prepare("delete_project", "DELETE FROM frame_projects WHERE id=$1");

  conn.prepare("list_projects", "SELECT " + kProjectColumns + " FROM frame_projects ORDER BY created_at_ms DESC, id ASC");

  conn.prepare("list_projects_by_owner",
               "SELECT " + kProjectColumns + " FROM frame_projects WHERE owner=$1 ORDER BY created_at_ms DESC, id ASC");

  conn.prepare("lock_project", "SELECT 1 FROM frame_projects WHERE id=$1 FOR SHARE");

  conn.prepare("upsert_output",
               "INSERT INTO frame_outputs(" + kOutputColumns +
                   ") VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
                   "ON CONFLICT(project_id, product_id) DO UPDATE SET "
                   "product_image_url=excluded.product_image_url, status=excluded.status, "
                   "failure_reason=excluded.failure_reason, image_key=excluded.image_key, "
                   "generated_at_ms=excluded.generated_at_ms");

  conn.prepare("get_output", "SELECT " + kOutputColumns + " FROM frame_outputs WHERE project_id=$1 AND product_id=$2");

  conn.prepare("count_outputs", "SELECT COUNT(*) FROM frame_outputs WHERE project_id=$1");

  conn.prepare("count_outputs_matching", "SELECT COUNT(*) FROM frame_outputs WHERE project_id=$1 AND product_id ILIKE $2 ESCAPE '\\'");

  conn.prepare("page_outputs",
               "SELECT " + kOutputColumns +
                   " FROM frame_outputs WHERE project_id=$1 AND product_id ILIKE $2 ESCAPE '\\' "
                   "ORDER BY generated_at_ms DESC, product_id COLLATE \"C\" ASC LIMIT $3 OFFSET $4");

  conn.prepare("output_status_counts", "SELECT status, COUNT(*) FROM frame_outputs GROUP BY status");

  conn.prepare("output_status_counts_by_project", "SELECT status, COUNT(*) FROM frame_outputs WHERE project_id=$1 GROUP BY status");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace framecomp::db::postgres
