#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace beacon::db::memory {

/*
  Transaction = repository lock + working copy.

  The lock is held from construction until Commit()/Rollback(), which makes
  insert-or-conflict checks atomic across concurrent callers.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         finished_ = false;
};

} // namespace beacon::db::memory
