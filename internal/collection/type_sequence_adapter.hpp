#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/collection/sequential_collection.hpp"

namespace typelog::collection {

// Produces tie-breaking suffixes in [1, kMaxSuffix].
using SuffixSource = std::function<uint32_t()>;

// Thread-local PRNG, uniform over [1, kMaxSuffix].
SuffixSource DefaultSuffixSource();

/*
  TypeSequenceAdapter

  Maps (collection urn, type name) onto one SequentialCollection, the
  sequence at "<collection urn>/<type name>". The sequence address is always
  recomputed, never stored.
*/
class TypeSequenceAdapter {
 public:
  explicit TypeSequenceAdapter(std::shared_ptr<SequentialCollection> sequences, SuffixSource suffixes = DefaultSuffixSource());

  static std::string SequenceUrn(const std::string& collection_urn, const std::string& type_name);

  // Timestamp defaults to now, suffix to the suffix source.
  OrderingKey Append(const std::string& collection_urn, const std::string& type_name, const typelog::v1::Envelope& value,
                     std::optional<uint64_t> timestamp_us = std::nullopt, std::optional<uint32_t> suffix = std::nullopt,
                     db::MutationPool* batch = nullptr) const;

  SequenceCursor Scan(const std::string& collection_urn, const std::string& type_name,
                      std::optional<OrderingKey> after = std::nullopt, std::optional<uint64_t> limit = std::nullopt,
                      bool include_suffix = true) const;

  uint64_t Count(const std::string& collection_urn, const std::string& type_name) const;

  const SequentialCollection& sequences() const {
    return *sequences_;
  }

 private:
  std::shared_ptr<SequentialCollection> sequences_;
  SuffixSource                          suffixes_;
};

} // namespace typelog::collection
