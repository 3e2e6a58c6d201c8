#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/collection/sequential_collection.hpp"
#include "internal/collection/type_sequence_adapter.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#if TYPELOG_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace typelog::factory {

namespace {

#if TYPELOG_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const typelog::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& path = database.sqlite().path();
    if (path.empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    TYPELOG_LOG_INFO("using sqlite store", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  if (database.has_postgres()) {
#if TYPELOG_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    TYPELOG_LOG_INFO("using postgres store", {observability::UintField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TYPELOG_LOG_INFO("using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

RuntimeDependencies BuildRuntime(const typelog::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  deps.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Collection stack
  // ------------------------------------------------------------------
  auto sequences = std::make_shared<collection::SequentialCollection>(deps.repository, config.collection().scan_page_size());

  deps.collections.repository = deps.repository;
  deps.collections.sequences  = std::make_shared<collection::TypeSequenceAdapter>(std::move(sequences));

  return deps;
}

} // namespace typelog::factory
