#pragma once

#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace typelog::db::memory {

/*
  Transaction = ordered write set.

  Reads go straight to committed state; writes are replayed in order under
  the repository lock on Commit(), so a commit is atomic with respect to
  every reader and to other commits.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  void Stage(MemoryRepository::Mutation mutation);

 private:
  MemoryRepository&                     repo_;
  std::vector<MemoryRepository::Mutation> writes_;
  bool                                  committed_   = false;
  bool                                  rolled_back_ = false;
};

} // namespace typelog::db::memory
