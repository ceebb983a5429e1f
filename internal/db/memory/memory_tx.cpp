#include "memory_tx.hpp"

#include <stdexcept>

namespace framecomp::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.tx_mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("transaction already rolled back");
  }
  undo_.clear();
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)(repo_.state_);
  }
  undo_.clear();
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace framecomp::db::memory
