#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace typelog::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result SetAttribute(Transaction&, const model::AttributeRecord&) override;
  std::vector<model::AttributeRecord> ResolveRow(Transaction&, const std::string& subject) override;
  Result DeleteSubject(Transaction&, const std::string& subject) override;

  std::vector<model::AttributeRecord> ScanAttribute(Transaction&, const std::string& subject_prefix, const std::string& attribute,
                                                    const std::optional<std::string>& after_subject,
                                                    std::optional<uint64_t> max_records) override;
  uint64_t CountAttribute(Transaction&, const std::string& subject_prefix, const std::string& attribute) override;
  Result DeleteSubjectsWithPrefix(Transaction&, const std::string& subject_prefix) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
