#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace typelog::db {

/*
  MutationPool

  Batch handle for attribute writes. Mutations are buffered in call order
  and reach the store together, inside one transaction, on Flush().

  - Flush() either applies every pending mutation or none of them
  - A failed Flush() keeps the pending set so the caller may retry
  - Destroying a pool with pending mutations discards them (logged)

  Thread-safe: several writers may stage into the same pool.
*/

class MutationPool {
 public:
  explicit MutationPool(std::shared_ptr<Repository> repository);
  ~MutationPool();

  MutationPool(const MutationPool&)            = delete;
  MutationPool& operator=(const MutationPool&) = delete;

  void Set(model::AttributeRecord record);
  void DeleteSubject(std::string subject);

  std::size_t Size() const;

  // Throws util::StoreError when the store rejects the batch.
  void Flush();

 private:
  struct Mutation {
    enum class Kind { Set, DeleteSubject };

    Kind                   kind;
    model::AttributeRecord record;
  };

  std::shared_ptr<Repository> repository_;

  mutable std::mutex    mutex_;
  std::vector<Mutation> pending_;
};

} // namespace typelog::db
