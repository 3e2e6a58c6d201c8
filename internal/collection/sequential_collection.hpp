#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/collection/ordering_key.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/mutation_pool.hpp"
#include "typelog/v1.hpp"

namespace typelog::collection {

struct SequenceEntry {
  OrderingKey           key;
  typelog::v1::Envelope value;
};

/*
  SequenceCursor

  Lazy, forward-only view over one sequence. Rows are fetched from the
  store one page at a time, each page in its own short transaction, so a
  cursor never pins a transaction between calls. Not restartable.
*/
class SequenceCursor {
 public:
  SequenceCursor(std::shared_ptr<db::Repository> repository, std::string sequence_urn, std::optional<OrderingKey> after,
                 std::optional<uint64_t> limit, bool include_suffix, std::size_t page_size);

  // Next entry in ascending key order, or nullopt once drained.
  std::optional<SequenceEntry> Next();

  // Drains the rest of the cursor.
  std::vector<SequenceEntry> Collect();

 private:
  void FetchPage();

  std::shared_ptr<db::Repository> repository_;
  std::string                     results_urn_;
  std::optional<std::string>      after_subject_;
  std::optional<uint64_t>         remaining_;
  bool                            include_suffix_;
  std::size_t                     page_size_;

  std::vector<db::model::AttributeRecord> page_;
  std::size_t                             position_  = 0;
  bool                                    exhausted_ = false;
};

/*
  SequentialCollection

  Append-only ordered log stored as attribute rows:

    <sequence-urn>/Results/<%016x timestamp>.<%06x suffix>
        typelog:sequential_value = serialized Envelope @ timestamp

  Two appends with the same key address the same row; the later one wins.
*/
class SequentialCollection {
 public:
  static constexpr const char*  kValueAttribute      = "typelog:sequential_value";
  static constexpr std::size_t  kDefaultScanPageSize = 256;

  explicit SequentialCollection(std::shared_ptr<db::Repository> repository, std::size_t scan_page_size = kDefaultScanPageSize);

  // Stages into `batch` when given, otherwise writes immediately.
  // Throws util::InvalidArgument for a suffix above kMaxSuffix,
  // util::StoreError when the store rejects the write.
  OrderingKey Append(const std::string& sequence_urn, const typelog::v1::Envelope& value, const OrderingKey& key,
                     db::MutationPool* batch = nullptr) const;

  // Entries strictly after `after`. Without suffixes every key is reported
  // with suffix 0 and `after` skips its whole timestamp.
  SequenceCursor Scan(const std::string& sequence_urn, std::optional<OrderingKey> after = std::nullopt,
                      std::optional<uint64_t> limit = std::nullopt, bool include_suffix = true) const;

  uint64_t Length(const std::string& sequence_urn) const;

  const std::shared_ptr<db::Repository>& repository() const {
    return repository_;
  }
  std::size_t scan_page_size() const {
    return page_size_;
  }

  static std::string ResultsUrn(const std::string& sequence_urn);
  static std::string ItemSubject(const std::string& sequence_urn, const OrderingKey& key);

  // Sequence urn owning an item row, or nullopt when `subject` is not one.
  static std::optional<std::string> SequenceUrnOf(const std::string& item_subject);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::size_t                     page_size_;
};

} // namespace typelog::collection
