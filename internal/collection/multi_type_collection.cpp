#include "internal/collection/multi_type_collection.hpp"

#include "internal/collection/envelope.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace typelog::collection {

namespace {

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw util::StoreError(prefix + " (" + db::ToString(result.code) + "): " + result.message);
  }
}

void RequireContext(const CollectionContext& ctx) {
  if (!ctx.repository || !ctx.sequences) {
    throw util::InvalidArgument("collection context requires a repository and a sequence adapter");
  }
}

} // namespace

// ---------------------------------------------------------------------
// CollectionCursor
// ---------------------------------------------------------------------

CollectionCursor::CollectionCursor(CollectionContext ctx, std::string urn, std::vector<std::string> types)
    : ctx_(std::move(ctx)), urn_(std::move(urn)), types_(std::move(types)) {
}

std::optional<CollectionEntry> CollectionCursor::Next() {
  while (type_index_ < types_.size()) {
    if (!current_) {
      current_.emplace(ctx_.sequences->Scan(urn_, types_[type_index_]));
    }

    if (auto entry = current_->Next()) {
      return CollectionEntry{types_[type_index_], entry->key, std::move(entry->value)};
    }

    current_.reset();
    ++type_index_;
  }
  return std::nullopt;
}

std::vector<CollectionEntry> CollectionCursor::Collect() {
  std::vector<CollectionEntry> out;
  while (auto entry = Next()) {
    out.push_back(std::move(*entry));
  }
  return out;
}

// ---------------------------------------------------------------------
// MultiTypeCollection
// ---------------------------------------------------------------------

MultiTypeCollection::MultiTypeCollection(CollectionContext ctx, std::string urn, AccessToken token)
    : ctx_(std::move(ctx)), urn_(std::move(urn)), token_(std::move(token)) {
  RequireContext(ctx_);
  if (urn_.empty()) {
    throw util::InvalidArgument("collection urn must not be empty");
  }
}

std::string MultiTypeCollection::TypeMarkerAttribute(const std::string& type_name) {
  return std::string(kTypeMarkerPrefix) + type_name;
}

OrderingKey MultiTypeCollection::StaticAdd(const CollectionContext& ctx, const std::string& urn, const AccessToken& token,
                                           const google::protobuf::Message* payload, const AddOptions& options,
                                           db::MutationPool* batch) {
  if (payload == nullptr) {
    throw util::InvalidArgument("payload must not be null");
  }
  if (options.suffix.has_value() && *options.suffix > kMaxSuffix) {
    throw util::InvalidArgument("suffix " + std::to_string(*options.suffix) + " exceeds 24 bits");
  }
  if (urn.empty()) {
    throw util::InvalidArgument("collection urn must not be empty");
  }
  RequireContext(ctx);

  const auto envelope  = WrapIfNeeded(*payload);
  const auto type_name = RoutingTypeName(envelope);

  const auto key = ctx.sequences->Append(urn, type_name, envelope, options.timestamp_us, options.suffix, batch);

  db::model::AttributeRecord marker;
  marker.subject      = urn;
  marker.attribute    = TypeMarkerAttribute(type_name);
  marker.value        = std::string(kTypeMarkerValue);
  marker.timestamp_us = 0;

  if (batch != nullptr) {
    batch->Set(std::move(marker));
  } else {
    auto tx = ctx.repository->Begin();
    ThrowIfError(ctx.repository->SetAttribute(*tx, marker), "write type marker on " + urn);
    tx->Commit();
  }

  TYPELOG_LOG_DEBUG("collection add",
                    {observability::StringField("urn", urn), observability::StringField("type", type_name),
                     observability::StringField("key", ToString(key)), observability::StringField("user", token.username),
                     observability::BoolField("batched", batch != nullptr)});
  return key;
}

OrderingKey MultiTypeCollection::Add(const google::protobuf::Message* payload, const AddOptions& options,
                                     db::MutationPool* batch) const {
  return StaticAdd(ctx_, urn_, token_, payload, options, batch);
}

std::set<std::string> MultiTypeCollection::ListStoredTypes() const {
  auto tx  = ctx_.repository->Begin();
  auto row = ctx_.repository->ResolveRow(*tx, urn_);
  tx->Commit();

  std::set<std::string> types;
  for (const auto& attribute : row) {
    if (attribute.attribute.size() > kTypeMarkerPrefix.size() && attribute.attribute.starts_with(kTypeMarkerPrefix)) {
      types.insert(attribute.attribute.substr(kTypeMarkerPrefix.size()));
    }
  }
  return types;
}

SequenceCursor MultiTypeCollection::ScanByType(const std::string& type_name, std::optional<OrderingKey> after,
                                               bool include_suffix, std::optional<uint64_t> limit) const {
  return ctx_.sequences->Scan(urn_, type_name, after, limit, include_suffix);
}

uint64_t MultiTypeCollection::LengthByType(const std::string& type_name) const {
  return ctx_.sequences->Count(urn_, type_name);
}

CollectionCursor MultiTypeCollection::Iterate() const {
  const auto types = ListStoredTypes();
  return CollectionCursor(ctx_, urn_, {types.begin(), types.end()});
}

uint64_t MultiTypeCollection::Size() const {
  uint64_t total = 0;
  for (const auto& type_name : ListStoredTypes()) {
    total += LengthByType(type_name);
  }
  return total;
}

void MultiTypeCollection::OnDelete(db::DeletionPool& pool) const {
  const auto page_size = ctx_.sequences->sequences().scan_page_size();

  std::set<std::string>      sequence_urns;
  std::optional<std::string> after;
  for (;;) {
    auto tx   = ctx_.repository->Begin();
    auto page = ctx_.repository->ScanAttribute(*tx, urn_, SequentialCollection::kValueAttribute, after, page_size);
    tx->Commit();

    for (const auto& row : page) {
      if (auto sequence_urn = SequentialCollection::SequenceUrnOf(row.subject)) {
        sequence_urns.insert(std::move(*sequence_urn));
      }
    }

    if (page.size() < page_size) {
      break;
    }
    after = page.back().subject;
  }

  for (const auto& sequence_urn : sequence_urns) {
    pool.MarkForDeletion(sequence_urn);
  }

  TYPELOG_LOG_INFO("collection scheduled for deletion",
                   {observability::StringField("urn", urn_), observability::UintField("sequences", sequence_urns.size()),
                    observability::StringField("user", token_.username), observability::StringField("reason", token_.reason)});
}

} // namespace typelog::collection
