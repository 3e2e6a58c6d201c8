#pragma once

namespace typelog::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - After Commit() all reads see the change
  - Commit() applies every write of the transaction or none of them
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: buffered write set, applied under the store lock
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
