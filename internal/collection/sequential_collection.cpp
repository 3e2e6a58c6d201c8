#include "internal/collection/sequential_collection.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace typelog::collection {

namespace {

constexpr std::string_view kResultsSegment = "/Results/";

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw util::StoreError(prefix + " (" + db::ToString(result.code) + "): " + result.message);
  }
}

} // namespace

// ---------------------------------------------------------------------
// SequenceCursor
// ---------------------------------------------------------------------

SequenceCursor::SequenceCursor(std::shared_ptr<db::Repository> repository, std::string sequence_urn,
                               std::optional<OrderingKey> after, std::optional<uint64_t> limit, bool include_suffix,
                               std::size_t page_size)
    : repository_(std::move(repository)),
      results_urn_(SequentialCollection::ResultsUrn(sequence_urn)),
      remaining_(limit),
      include_suffix_(include_suffix),
      page_size_(page_size == 0 ? SequentialCollection::kDefaultScanPageSize : page_size) {
  if (after.has_value()) {
    if (!include_suffix_) {
      after->suffix = kMaxSuffix;
    }
    after_subject_ = SequentialCollection::ItemSubject(sequence_urn, *after);
  }
  exhausted_ = remaining_.has_value() && *remaining_ == 0;
}

void SequenceCursor::FetchPage() {
  page_.clear();
  position_ = 0;

  auto tx = repository_->Begin();
  page_   = repository_->ScanAttribute(*tx, results_urn_, SequentialCollection::kValueAttribute, after_subject_, page_size_);
  tx->Commit();

  if (page_.size() < page_size_) {
    exhausted_ = true;
  }
  if (!page_.empty()) {
    after_subject_ = page_.back().subject;
  }
}

std::optional<SequenceEntry> SequenceCursor::Next() {
  for (;;) {
    if (remaining_.has_value() && *remaining_ == 0) {
      return std::nullopt;
    }
    if (position_ >= page_.size()) {
      if (exhausted_) {
        return std::nullopt;
      }
      FetchPage();
      continue;
    }

    const auto& row = page_[position_++];
    auto        key = DecodeOrderingKey(std::string_view(row.subject).substr(results_urn_.size() + 1));
    if (!key) {
      TYPELOG_LOG_WARN("skipping sequence row with malformed item name", {observability::StringField("subject", row.subject)});
      continue;
    }

    SequenceEntry entry;
    if (!entry.value.ParseFromString(row.value)) {
      throw util::StoreError("stored value at " + row.subject + " is not a valid envelope");
    }
    entry.key = *key;
    if (!include_suffix_) {
      entry.key.suffix = 0;
    }

    if (remaining_.has_value()) {
      --*remaining_;
    }
    return entry;
  }
}

std::vector<SequenceEntry> SequenceCursor::Collect() {
  std::vector<SequenceEntry> out;
  while (auto entry = Next()) {
    out.push_back(std::move(*entry));
  }
  return out;
}

// ---------------------------------------------------------------------
// SequentialCollection
// ---------------------------------------------------------------------

SequentialCollection::SequentialCollection(std::shared_ptr<db::Repository> repository, std::size_t scan_page_size)
    : repository_(std::move(repository)), page_size_(scan_page_size == 0 ? kDefaultScanPageSize : scan_page_size) {
  if (!repository_) {
    throw util::InvalidArgument("sequential collection requires a repository");
  }
}

std::string SequentialCollection::ResultsUrn(const std::string& sequence_urn) {
  return sequence_urn + "/Results";
}

std::string SequentialCollection::ItemSubject(const std::string& sequence_urn, const OrderingKey& key) {
  return ResultsUrn(sequence_urn) + "/" + EncodeOrderingKey(key);
}

std::optional<std::string> SequentialCollection::SequenceUrnOf(const std::string& item_subject) {
  const auto pos = item_subject.rfind(kResultsSegment);
  if (pos == std::string::npos || pos == 0 || pos + kResultsSegment.size() == item_subject.size()) {
    return std::nullopt;
  }
  return item_subject.substr(0, pos);
}

OrderingKey SequentialCollection::Append(const std::string& sequence_urn, const typelog::v1::Envelope& value,
                                         const OrderingKey& key, db::MutationPool* batch) const {
  if (sequence_urn.empty()) {
    throw util::InvalidArgument("sequence urn must not be empty");
  }
  if (key.suffix > kMaxSuffix) {
    throw util::InvalidArgument("suffix " + std::to_string(key.suffix) + " exceeds 24 bits");
  }

  db::model::AttributeRecord record;
  record.subject      = ItemSubject(sequence_urn, key);
  record.attribute    = kValueAttribute;
  record.value        = value.SerializeAsString();
  record.timestamp_us = key.timestamp_us;

  if (batch != nullptr) {
    batch->Set(std::move(record));
    return key;
  }

  auto tx = repository_->Begin();
  ThrowIfError(repository_->SetAttribute(*tx, record), "append to " + sequence_urn);
  tx->Commit();
  return key;
}

SequenceCursor SequentialCollection::Scan(const std::string& sequence_urn, std::optional<OrderingKey> after,
                                          std::optional<uint64_t> limit, bool include_suffix) const {
  return SequenceCursor(repository_, sequence_urn, after, limit, include_suffix, page_size_);
}

uint64_t SequentialCollection::Length(const std::string& sequence_urn) const {
  auto tx    = repository_->Begin();
  auto count = repository_->CountAttribute(*tx, ResultsUrn(sequence_urn), kValueAttribute);
  tx->Commit();
  return count;
}

} // namespace typelog::collection
