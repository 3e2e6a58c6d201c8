#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace typelog::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
