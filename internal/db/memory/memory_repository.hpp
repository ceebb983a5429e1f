#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace framecomp::db::memory {

class MemoryTransaction;

/*
  In-process repository for tests and single-node throwaway deployments.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::FrameProjectRecord> projects;
    // project_id -> product_id -> row
    std::unordered_map<std::string, std::map<std::string, model::OutputRecord>> outputs;
  };

  // held by the open transaction for its whole lifetime
  std::mutex tx_mutex_;
  State      state_;
};

}
