#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/message.h>

#include "internal/collection/type_sequence_adapter.hpp"
#include "internal/db/deletion_pool.hpp"

namespace typelog::collection {

// Identity of the caller. Carried and logged; no authorization is done here.
struct AccessToken {
  std::string username;
  std::string reason;
};

struct AddOptions {
  std::optional<uint64_t> timestamp_us;
  std::optional<uint32_t> suffix;
};

struct CollectionContext {
  std::shared_ptr<db::Repository>      repository;
  std::shared_ptr<TypeSequenceAdapter> sequences;
};

struct CollectionEntry {
  std::string           type_name;
  OrderingKey           key;
  typelog::v1::Envelope value;
};

/*
  CollectionCursor

  Walks every stored type in turn, draining each type's sequence before
  moving to the next. There is no ordering across types.
*/
class CollectionCursor {
 public:
  CollectionCursor(CollectionContext ctx, std::string urn, std::vector<std::string> types);

  std::optional<CollectionEntry> Next();
  std::vector<CollectionEntry>   Collect();

 private:
  CollectionContext             ctx_;
  std::string                   urn_;
  std::vector<std::string>      types_;
  std::size_t                   type_index_ = 0;
  std::optional<SequenceCursor> current_;
};

/*
  MultiTypeCollection

  One logical log whose entries are routed, by payload type, into one
  ordered sequence per type (see TypeSequenceAdapter). Types in use are
  recorded as marker attributes on the collection's own row:

    <urn>   typelog:value_type_<full type name> = "1" @ 0

  so discovering them costs a single row read.

  Write ordering: the entry is appended before its type marker is written.
  Without a batch these are two independent writes; if the marker write
  fails the entry stays readable through ScanByType() but its type is
  invisible to ListStoredTypes(), Iterate() and Size(). Passing a
  db::MutationPool stages both into the same pool so they reach the store
  in one transaction on Flush().

  Counts and type lists are recomputed on every call.
*/
class MultiTypeCollection {
 public:
  static constexpr std::string_view kTypeMarkerPrefix = "typelog:value_type_";
  static constexpr std::string_view kTypeMarkerValue  = "1";

  MultiTypeCollection(CollectionContext ctx, std::string urn, AccessToken token = {});

  // Throws util::InvalidArgument for a null payload before touching the
  // store; util::StoreError when a write fails.
  static OrderingKey StaticAdd(const CollectionContext& ctx, const std::string& urn, const AccessToken& token,
                               const google::protobuf::Message* payload, const AddOptions& options = {},
                               db::MutationPool* batch = nullptr);

  OrderingKey Add(const google::protobuf::Message* payload, const AddOptions& options = {},
                  db::MutationPool* batch = nullptr) const;

  std::set<std::string> ListStoredTypes() const;

  // include_suffix defaults to true so entries sharing a timestamp keep
  // distinct keys. With false every suffix reads back as 0 and `after`
  // skips its whole timestamp.
  SequenceCursor ScanByType(const std::string& type_name, std::optional<OrderingKey> after = std::nullopt,
                            bool include_suffix = true, std::optional<uint64_t> limit = std::nullopt) const;

  uint64_t LengthByType(const std::string& type_name) const;

  CollectionCursor Iterate() const;

  uint64_t Size() const;

  // Registers every sequence that holds entries under this collection,
  // including ones whose type marker was never written.
  void OnDelete(db::DeletionPool& pool) const;

  const std::string& urn() const {
    return urn_;
  }

  static std::string TypeMarkerAttribute(const std::string& type_name);

 private:
  CollectionContext ctx_;
  std::string       urn_;
  AccessToken       token_;
};

} // namespace typelog::collection
