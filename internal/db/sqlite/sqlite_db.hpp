#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace typelog::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all transactions; TransactionLock() serializes
  them so BEGIN/COMMIT pairs never interleave on the connection.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations); throws util::StoreError
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  std::unique_lock<std::mutex> TransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace typelog::db::sqlite
