#include "migrations.hpp"

namespace typelog::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS attributes (subject TEXT NOT NULL, attribute TEXT NOT NULL, value BLOB NOT NULL, timestamp_us INTEGER NOT NULL, PRIMARY KEY (subject, attribute)) WITHOUT ROWID;",
      "CREATE INDEX IF NOT EXISTS attributes_by_attribute ON attributes(attribute, subject);",
      "CREATE TABLE IF NOT EXISTS typelog_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO typelog_schema_migrations(version, applied_at_ms) VALUES (1, unixepoch() * 1000);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  // COLLATE "C" keeps subject order bytewise, matching the other backends.
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS attributes (subject TEXT COLLATE \"C\" NOT NULL, attribute TEXT COLLATE \"C\" NOT NULL, value BYTEA NOT NULL, timestamp_us BIGINT NOT NULL, PRIMARY KEY (subject, attribute));",
      "CREATE INDEX IF NOT EXISTS attributes_by_attribute ON attributes(attribute, subject);",
      "CREATE TABLE IF NOT EXISTS typelog_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
      "INSERT INTO typelog_schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;"};
  return kSchema;
}

} // namespace typelog::db::sql
