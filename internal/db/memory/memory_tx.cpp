#include "memory_tx.hpp"

#include <stdexcept>

namespace beacon::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (finished_) {
    throw std::logic_error("memory transaction used after commit or rollback");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("memory transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  finished_        = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  lock_.unlock();
}

} // namespace beacon::db::memory
