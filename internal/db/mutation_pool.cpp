#include "internal/db/mutation_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace typelog::db {

MutationPool::MutationPool(std::shared_ptr<Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw util::InvalidArgument("mutation pool requires a repository");
  }
}

MutationPool::~MutationPool() {
  std::lock_guard lock(mutex_);
  if (!pending_.empty()) {
    TYPELOG_LOG_WARN("mutation pool destroyed with pending mutations",
                     {observability::UintField("discarded", pending_.size())});
  }
}

void MutationPool::Set(model::AttributeRecord record) {
  std::lock_guard lock(mutex_);
  pending_.push_back({Mutation::Kind::Set, std::move(record)});
}

void MutationPool::DeleteSubject(std::string subject) {
  model::AttributeRecord record;
  record.subject = std::move(subject);

  std::lock_guard lock(mutex_);
  pending_.push_back({Mutation::Kind::DeleteSubject, std::move(record)});
}

std::size_t MutationPool::Size() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

void MutationPool::Flush() {
  std::lock_guard lock(mutex_);
  if (pending_.empty()) {
    return;
  }

  auto tx = repository_->Begin();
  for (const auto& mutation : pending_) {
    Result r = mutation.kind == Mutation::Kind::Set ? repository_->SetAttribute(*tx, mutation.record)
                                                    : repository_->DeleteSubject(*tx, mutation.record.subject);
    if (!r) {
      tx->Rollback();
      throw util::StoreError(std::string("mutation pool flush failed (") + ToString(r.code) + "): " + r.message);
    }
  }
  tx->Commit();

  TYPELOG_LOG_DEBUG("mutation pool flushed", {observability::UintField("mutations", pending_.size())});
  pending_.clear();
}

} // namespace typelog::db
