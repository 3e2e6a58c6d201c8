#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace typelog::db {

/*
  DeletionPool

  Collects the urns scheduled for removal. Marking has no effect on the
  store; Flush() deletes every marked row together with all rows beneath
  it, in a single transaction, and then clears the marks.
*/

class DeletionPool {
 public:
  explicit DeletionPool(std::shared_ptr<Repository> repository);

  void MarkForDeletion(const std::string& urn);
  bool IsMarked(const std::string& urn) const;

  // Marked urns in ascending order.
  std::vector<std::string> Marked() const;

  void Flush();

 private:
  std::shared_ptr<Repository> repository_;

  mutable std::mutex    mutex_;
  std::set<std::string> marked_;
};

} // namespace typelog::db
