#include "memory_tx.hpp"

#include <stdexcept>

namespace typelog::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Stage(MemoryRepository::Mutation mutation) {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  writes_.push_back(std::move(mutation));
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("memory transaction already rolled back");
  }
  repo_.Apply(writes_);
  writes_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  rolled_back_ = true;
}

} // namespace typelog::db::memory
