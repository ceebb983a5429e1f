#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace framecomp::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      FRAMECOMP_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  tx_->abort();
  finished_ = true;
}

}
