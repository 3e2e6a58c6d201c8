#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/attribute_record.hpp"

namespace typelog::db {

/*
  Attribute store abstraction.

  Data model: rows addressed by a subject string, each row holding any
  number of named attributes, each attribute holding one (value, timestamp)
  pair. Writing an existing attribute replaces it (last writer wins).

  GUARANTEES:

  - All operations run inside a Transaction
  - Reads inside a SQL transaction see its own writes; the memory backend
    only exposes writes after Commit()
  - Scans return subjects in ascending bytewise order

  Ranged operations address the rows strictly beneath a prefix
  (see internal/db/api/subjects.hpp); the prefix row itself is excluded.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Point operations
  // ---------------------------------------------------------------------

  virtual Result SetAttribute(Transaction&, const model::AttributeRecord&) = 0;

  // All attributes of one row, ordered by attribute name.
  virtual std::vector<model::AttributeRecord> ResolveRow(Transaction&, const std::string& subject) = 0;

  virtual Result DeleteSubject(Transaction&, const std::string& subject) = 0;

  // ---------------------------------------------------------------------
  // Ranged operations
  // ---------------------------------------------------------------------

  // Rows beneath `subject_prefix` carrying `attribute`, strictly after
  // `after_subject` when given, at most `max_records` of them.
  virtual std::vector<model::AttributeRecord> ScanAttribute(Transaction&, const std::string& subject_prefix, const std::string& attribute,
                                                            const std::optional<std::string>& after_subject,
                                                            std::optional<uint64_t> max_records) = 0;

  virtual uint64_t CountAttribute(Transaction&, const std::string& subject_prefix, const std::string& attribute) = 0;

  // Removes every row beneath `subject_prefix` (not the prefix row itself).
  virtual Result DeleteSubjectsWithPrefix(Transaction&, const std::string& subject_prefix) = 0;
};

} // namespace typelog::db
