#include "internal/db/deletion_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace typelog::db {

namespace {

void ThrowIfError(const Result& r, const std::string& urn) {
  if (!r) {
    throw util::StoreError("delete " + urn + " failed (" + ToString(r.code) + "): " + r.message);
  }
}

} // namespace

DeletionPool::DeletionPool(std::shared_ptr<Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw util::InvalidArgument("deletion pool requires a repository");
  }
}

void DeletionPool::MarkForDeletion(const std::string& urn) {
  if (urn.empty()) {
    throw util::InvalidArgument("cannot mark an empty urn for deletion");
  }
  std::lock_guard lock(mutex_);
  marked_.insert(urn);
}

bool DeletionPool::IsMarked(const std::string& urn) const {
  std::lock_guard lock(mutex_);
  return marked_.contains(urn);
}

std::vector<std::string> DeletionPool::Marked() const {
  std::lock_guard lock(mutex_);
  return {marked_.begin(), marked_.end()};
}

void DeletionPool::Flush() {
  std::lock_guard lock(mutex_);
  if (marked_.empty()) {
    return;
  }

  auto tx = repository_->Begin();
  for (const auto& urn : marked_) {
    Result r = repository_->DeleteSubject(*tx, urn);
    if (r) {
      r = repository_->DeleteSubjectsWithPrefix(*tx, urn);
    }
    if (!r) {
      tx->Rollback();
      ThrowIfError(r, urn);
    }
  }
  tx->Commit();

  TYPELOG_LOG_INFO("deletion pool flushed", {observability::UintField("urns", marked_.size())});
  marked_.clear();
}

} // namespace typelog::db
