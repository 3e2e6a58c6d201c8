#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace typelog::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  try {
    conn_ = pool->Acquire();
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const std::exception& e) {
    throw util::StoreError(std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      TYPELOG_LOG_WARN("postgres rollback on destruction failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    // pqxx leaves the transaction closed after a failed commit
    finished_ = true;
    throw util::StoreError(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    throw util::StoreError(std::string("postgres rollback: ") + e.what());
  }
}

}
