#pragma once

#include <string>
#include <vector>

namespace typelog::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Bootstrap schema of the attribute store, per dialect.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace typelog::db::sql
