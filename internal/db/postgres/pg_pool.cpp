#include "pg_pool.hpp"

namespace typelog::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

// Values cross the wire as hex text so the same binding works on every
// libpqxx release, whatever its bytea conversion API.
void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_attribute",
               "INSERT INTO attributes(subject,attribute,value,timestamp_us) "
               "VALUES($1,$2,decode($3,'hex'),$4) "
               "ON CONFLICT(subject,attribute) DO UPDATE SET "
               "value=EXCLUDED.value, timestamp_us=EXCLUDED.timestamp_us");

  conn.prepare("select_row",
               "SELECT subject,attribute,encode(value,'hex'),timestamp_us "
               "FROM attributes WHERE subject=$1 ORDER BY attribute");

  conn.prepare("delete_row", "DELETE FROM attributes WHERE subject=$1");

  conn.prepare("scan_attribute",
               "SELECT subject,attribute,encode(value,'hex'),timestamp_us "
               "FROM attributes WHERE attribute=$1 AND subject>$2 AND subject<$3 "
               "ORDER BY subject LIMIT $4");

  conn.prepare("count_attribute",
               "SELECT COUNT(*) FROM attributes "
               "WHERE attribute=$1 AND subject>$2 AND subject<$3");

  conn.prepare("delete_rows_in_range", "DELETE FROM attributes WHERE subject>$1 AND subject<$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace typelog::db::postgres
