#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/frame_project_record.hpp"
#include "internal/db/model/output_record.hpp"

namespace framecomp::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - (project_id, product_id) is unique among outputs
  - Deleting a project deletes its outputs

  The DB is the source of truth for:
    frame projects
    outputs
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Lightweight liveness check of the backing store.
  virtual Result Ping() = 0;

  // ---------------------------------------------------------------------
  // Frame projects
  // ---------------------------------------------------------------------

  virtual Result InsertProject(Transaction&, const model::FrameProjectRecord&) = 0;

  virtual std::optional<model::FrameProjectRecord> GetProject(Transaction&, const std::string& id) = 0;

  // Newest first. Empty owner lists every project.
  virtual std::vector<model::FrameProjectRecord> ListProjects(Transaction&, const std::string& owner) = 0;

  virtual Result UpdateProject(Transaction&, const model::FrameProjectRecord&) = 0;

  // Removes the project and all of its outputs.
  virtual Result DeleteProject(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Outputs
  // ---------------------------------------------------------------------

  /*
    Insert or overwrite the row for (project_id, product_id).
    An existing row keeps its created_at_ms.
    Fails with NotFound when the project does not exist.
  */
  virtual Result UpsertOutput(Transaction&, const model::OutputRecord&) = 0;

  virtual std::optional<model::OutputRecord> GetOutput(Transaction&, const std::string& project_id, const std::string& product_id) = 0;

  /*
    rows are ordered by generated_at_ms desc, then product_id asc.
    total counts every output of the project, filtered those matching search.
  */
  virtual model::OutputPage PageOutputs(Transaction&, const model::OutputQuery&) = 0;

  // Empty project_id counts across all projects.
  virtual model::OutputCounts CountOutputs(Transaction&, const std::string& project_id) = 0;
};

} // namespace framecomp::db
