#include "memory_tx.hpp"

#include <stdexcept>

namespace gigbook::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) throw std::logic_error("memory transaction already finished");
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace gigbook::db::memory
