#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace framecomp::db::memory {

/*
  Transaction = exclusive lock + undo log.

  Writes are applied in place; Rollback() replays the undo log in
  reverse. Only one transaction is open at a time.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Undo = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable(Undo undo) {
    undo_.push_back(std::move(undo));
    return repo_.state_;
  }
  const MemoryRepository::State& View() const {
    return repo_.state_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  std::vector<Undo>            undo_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace framecomp::db::memory
