#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace typelog::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // subject -> attribute -> record; both levels ordered
  using Row  = std::map<std::string, model::AttributeRecord>;
  using Rows = std::map<std::string, Row>;

  struct Mutation {
    enum class Kind { Set, DeleteSubject, DeletePrefix };

    Kind                   kind;
    model::AttributeRecord record;  // Set: full record; deletes: subject only
  };

  void Apply(const std::vector<Mutation>& mutations);

  std::mutex mutex_;
  Rows       committed_;
};

}
