#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace framecomp::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  Result Ping() override;

  Result InsertProject(Transaction&, const model::FrameProjectRecord&) override;
  std::optional<model::FrameProjectRecord> GetProject(Transaction&, const std::string&) override;
  std::vector<model::FrameProjectRecord> ListProjects(Transaction&, const std::string& owner) override;
  Result UpdateProject(Transaction&, const model::FrameProjectRecord&) override;
  Result DeleteProject(Transaction&, const std::string&) override;

  Result UpsertOutput(Transaction&, const model::OutputRecord&) override;
  std::optional<model::OutputRecord> GetOutput(Transaction&, const std::string& project_id, const std::string& product_id) override;
  model::OutputPage PageOutputs(Transaction&, const model::OutputQuery&) override;
  model::OutputCounts CountOutputs(Transaction&, const std::string& project_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
