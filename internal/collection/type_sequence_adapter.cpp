#include "internal/collection/type_sequence_adapter.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/random.hpp"
#include "internal/util/time.hpp"

namespace typelog::collection {

namespace {

void RequireTypeName(const std::string& type_name) {
  if (type_name.empty()) {
    throw util::InvalidArgument("type name must not be empty");
  }
}

} // namespace

SuffixSource DefaultSuffixSource() {
  return [] { return util::RandomUint32(1, kMaxSuffix); };
}

TypeSequenceAdapter::TypeSequenceAdapter(std::shared_ptr<SequentialCollection> sequences, SuffixSource suffixes)
    : sequences_(std::move(sequences)), suffixes_(std::move(suffixes)) {
  if (!sequences_) {
    throw util::InvalidArgument("type sequence adapter requires a sequential collection");
  }
  if (!suffixes_) {
    suffixes_ = DefaultSuffixSource();
  }
}

std::string TypeSequenceAdapter::SequenceUrn(const std::string& collection_urn, const std::string& type_name) {
  return collection_urn + "/" + type_name;
}

OrderingKey TypeSequenceAdapter::Append(const std::string& collection_urn, const std::string& type_name,
                                        const typelog::v1::Envelope& value, std::optional<uint64_t> timestamp_us,
                                        std::optional<uint32_t> suffix, db::MutationPool* batch) const {
  RequireTypeName(type_name);

  OrderingKey key;
  key.timestamp_us = timestamp_us.value_or(util::NowMicros());
  key.suffix       = suffix.has_value() ? *suffix : suffixes_();

  return sequences_->Append(SequenceUrn(collection_urn, type_name), value, key, batch);
}

SequenceCursor TypeSequenceAdapter::Scan(const std::string& collection_urn, const std::string& type_name,
                                         std::optional<OrderingKey> after, std::optional<uint64_t> limit,
                                         bool include_suffix) const {
  RequireTypeName(type_name);
  return sequences_->Scan(SequenceUrn(collection_urn, type_name), after, limit, include_suffix);
}

uint64_t TypeSequenceAdapter::Count(const std::string& collection_urn, const std::string& type_name) const {
  RequireTypeName(type_name);
  return sequences_->Length(SequenceUrn(collection_urn, type_name));
}

} // namespace typelog::collection
