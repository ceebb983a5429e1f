#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace framecomp::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
