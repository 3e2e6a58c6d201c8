#include "internal/collection/multi_type_collection.hpp"

#include <google/protobuf/wrappers.pb.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using typelog::collection::CollectionContext;
using typelog::collection::MultiTypeCollection;
using typelog::collection::OrderingKey;
using typelog::collection::SequentialCollection;
using typelog::collection::TypeSequenceAdapter;
using typelog::db::memory::MemoryRepository;

constexpr const char* kInt    = "google.protobuf.Int64Value";
constexpr const char* kString = "google.protobuf.StringValue";
constexpr const char* kBool   = "google.protobuf.BoolValue";

// Stores everything except type markers, which it rejects.
class MarkerRejectingRepository final : public typelog::db::Repository {
 public:
  std::unique_ptr<typelog::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  typelog::db::Result SetAttribute(typelog::db::Transaction& tx, const typelog::db::model::AttributeRecord& r) override {
    if (r.attribute.starts_with(MultiTypeCollection::kTypeMarkerPrefix)) {
      return typelog::db::Result::Err(typelog::db::ErrorCode::IOError, "marker write refused");
    }
    return inner_.SetAttribute(tx, r);
  }
  std::vector<typelog::db::model::AttributeRecord> ResolveRow(typelog::db::Transaction& tx, const std::string& subject) override {
    return inner_.ResolveRow(tx, subject);
  }
  typelog::db::Result DeleteSubject(typelog::db::Transaction& tx, const std::string& subject) override {
    return inner_.DeleteSubject(tx, subject);
  }
  std::vector<typelog::db::model::AttributeRecord> ScanAttribute(typelog::db::Transaction& tx, const std::string& prefix,
                                                                 const std::string& attribute,
                                                                 const std::optional<std::string>& after,
                                                                 std::optional<uint64_t> max_records) override {
    return inner_.ScanAttribute(tx, prefix, attribute, after, max_records);
  }
  uint64_t CountAttribute(typelog::db::Transaction& tx, const std::string& prefix, const std::string& attribute) override {
    return inner_.CountAttribute(tx, prefix, attribute);
  }
  typelog::db::Result DeleteSubjectsWithPrefix(typelog::db::Transaction& tx, const std::string& prefix) override {
    return inner_.DeleteSubjectsWithPrefix(tx, prefix);
  }

 private:
  MemoryRepository inner_;
};

CollectionContext MakeContext(std::shared_ptr<typelog::db::Repository> repo = std::make_shared<MemoryRepository>()) {
  auto sequences = std::make_shared<SequentialCollection>(repo, 4);
  return CollectionContext{.repository = repo, .sequences = std::make_shared<TypeSequenceAdapter>(sequences)};
}

google::protobuf::Int64Value Int(int64_t v) {
  google::protobuf::Int64Value m;
  m.set_value(v);
  return m;
}

google::protobuf::StringValue Str(const std::string& v) {
  google::protobuf::StringValue m;
  m.set_value(v);
  return m;
}

int64_t UnwrapInt(const typelog::v1::Envelope& envelope) {
  google::protobuf::Int64Value m;
  assert(envelope.payload().UnpackTo(&m));
  return m.value();
}

void TestScenario() {
  MultiTypeCollection coll(MakeContext(), "/c");

  // A = Int64Value, B = StringValue; second A written first on purpose.
  auto a1 = Int(1);
  auto a2 = Int(2);
  auto b  = Str("b");
  assert((coll.Add(&a2, {.timestamp_us = 100, .suffix = 7}) == OrderingKey{100, 7}));
  assert((coll.Add(&a1, {.timestamp_us = 100, .suffix = 5}) == OrderingKey{100, 5}));
  coll.Add(&b, {.timestamp_us = 50});

  auto a = coll.ScanByType(kInt).Collect();
  assert(a.size() == 2);
  assert((a[0].key == OrderingKey{100, 5}) && UnwrapInt(a[0].value) == 1);
  assert((a[1].key == OrderingKey{100, 7}) && UnwrapInt(a[1].value) == 2);

  assert((coll.ListStoredTypes() == std::set<std::string>{kInt, kString}));
  assert(coll.Size() == 3);
}

void TestRoutingAndTypeIsolation() {
  MultiTypeCollection coll(MakeContext(), "/c");

  auto s = Str("hello");
  coll.Add(&s, {.timestamp_us = 1, .suffix = 1});
  google::protobuf::BoolValue flag;
  flag.set_value(true);
  coll.Add(&flag, {.timestamp_us = 2, .suffix = 1});

  auto strings = coll.ScanByType(kString).Collect();
  assert(strings.size() == 1);
  assert(strings[0].value.payload().Is<google::protobuf::StringValue>());

  auto bools = coll.ScanByType(kBool).Collect();
  assert(bools.size() == 1);
  assert(bools[0].value.payload().Is<google::protobuf::BoolValue>());

  assert(coll.ScanByType(kInt).Collect().empty());
}

void TestEnvelopesKeepTheirMetadata() {
  MultiTypeCollection coll(MakeContext(), "/c");

  auto                  inner = Int(9);
  typelog::v1::Envelope envelope;
  envelope.mutable_payload()->PackFrom(inner);
  envelope.set_source("client-1");
  coll.Add(&envelope, {.timestamp_us = 1, .suffix = 1});

  typelog::v1::Envelope bare;
  bare.set_source("no payload");
  coll.Add(&bare, {.timestamp_us = 2, .suffix = 1});

  auto ints = coll.ScanByType(kInt).Collect();
  assert(ints.size() == 1);
  assert(ints[0].value.source() == "client-1");

  assert(coll.ListStoredTypes().contains("typelog.v1.Envelope"));
  assert(coll.LengthByType("typelog.v1.Envelope") == 1);
}

void TestEqualTimestampsNeverOverwrite() {
  auto     repo      = std::make_shared<MemoryRepository>();
  auto     sequences = std::make_shared<SequentialCollection>(repo, 4);
  uint32_t next      = 50;
  auto     adapter   = std::make_shared<TypeSequenceAdapter>(sequences, [&next] { return next--; });
  MultiTypeCollection coll(CollectionContext{.repository = repo, .sequences = adapter}, "/c");

  for (int i = 0; i < 50; ++i) {
    auto v = Int(i);
    coll.Add(&v, {.timestamp_us = 1000});
  }

  auto entries = coll.ScanByType(kInt).Collect();
  assert(entries.size() == 50);
  for (std::size_t i = 1; i < entries.size(); ++i) {
    assert(entries[i - 1].key < entries[i].key);
  }
  // suffixes were handed out in descending order, so the last write reads first
  assert(UnwrapInt(entries.front().value) == 49);
}

void TestCountConsistency() {
  MultiTypeCollection coll(MakeContext(), "/c");

  for (int i = 0; i < 9; ++i) {
    auto v = Int(i);
    coll.Add(&v, {.timestamp_us = static_cast<uint64_t>(i), .suffix = 1});
  }
  for (int i = 0; i < 5; ++i) {
    auto v = Str(std::to_string(i));
    coll.Add(&v, {.timestamp_us = static_cast<uint64_t>(i), .suffix = 1});
  }

  uint64_t by_type = 0;
  for (const auto& type_name : coll.ListStoredTypes()) {
    by_type += coll.LengthByType(type_name);
  }

  const auto all = coll.Iterate().Collect();
  assert(coll.Size() == 14);
  assert(by_type == 14);
  assert(all.size() == 14);

  // each type is drained before the next one starts
  std::vector<std::string> order;
  for (const auto& entry : all) {
    if (order.empty() || order.back() != entry.type_name) order.push_back(entry.type_name);
  }
  assert(order.size() == 2);
}

void TestScanWithoutSuffix() {
  MultiTypeCollection coll(MakeContext(), "/c");

  for (uint32_t suffix = 1; suffix <= 3; ++suffix) {
    auto v = Int(suffix);
    coll.Add(&v, {.timestamp_us = 100, .suffix = suffix});
  }
  auto later = Int(4);
  coll.Add(&later, {.timestamp_us = 101, .suffix = 1});

  auto keys = coll.ScanByType(kInt, std::nullopt, false).Collect();
  assert(keys.size() == 4);
  assert((keys[0].key == OrderingKey{100, 0}));

  auto after = coll.ScanByType(kInt, OrderingKey{100, 0}, false).Collect();
  assert(after.size() == 1);
  assert((after[0].key == OrderingKey{101, 0}));

  auto limited = coll.ScanByType(kInt, std::nullopt, true, 2).Collect();
  assert(limited.size() == 2);
}

void TestNullPayloadIsRejectedWithoutWrites() {
  auto                repo = std::make_shared<MemoryRepository>();
  MultiTypeCollection coll(MakeContext(repo), "/c");

  bool threw = false;
  try {
    coll.Add(nullptr);
  } catch (const typelog::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  auto tx = repo->Begin();
  assert(repo->ResolveRow(*tx, "/c").empty());
  assert(repo->CountAttribute(*tx, "/c", SequentialCollection::kValueAttribute) == 0);
  tx->Commit();

  threw = false;
  try {
    auto v = Int(1);
    coll.Add(&v, {.suffix = 0x1000000});
  } catch (const typelog::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(coll.Size() == 0);
}

void TestStaticAddNeedsNoInstance() {
  auto ctx = MakeContext();

  auto v = Str("static");
  MultiTypeCollection::StaticAdd(ctx, "/c", {.username = "alice", .reason = "import"}, &v, {.timestamp_us = 5, .suffix = 5});

  MultiTypeCollection coll(ctx, "/c");
  assert((coll.ListStoredTypes() == std::set<std::string>{kString}));
  assert(coll.LengthByType(kString) == 1);
}

void TestBatchedAddLandsTogether() {
  auto                      repo = std::make_shared<MemoryRepository>();
  auto                      ctx  = MakeContext(repo);
  typelog::db::MutationPool pool(repo);
  MultiTypeCollection       coll(ctx, "/c");

  auto a = Int(1);
  auto b = Str("b");
  coll.Add(&a, {.timestamp_us = 1, .suffix = 1}, &pool);
  coll.Add(&b, {.timestamp_us = 2, .suffix = 1}, &pool);

  // entry + marker per add
  assert(pool.Size() == 4);
  assert(coll.ListStoredTypes().empty());
  assert(coll.LengthByType(kInt) == 0);

  pool.Flush();
  assert(coll.ListStoredTypes().size() == 2);
  assert(coll.Size() == 2);
}

void TestFailedMarkerWriteLeavesEntryReadableByType() {
  auto                repo = std::make_shared<MarkerRejectingRepository>();
  MultiTypeCollection coll(MakeContext(repo), "/c");

  auto v     = Int(1);
  bool threw = false;
  try {
    coll.Add(&v, {.timestamp_us = 1, .suffix = 1});
  } catch (const typelog::util::StoreError&) {
    threw = true;
  }
  assert(threw);

  assert(coll.ScanByType(kInt).Collect().size() == 1);
  assert(coll.LengthByType(kInt) == 1);
  assert(coll.ListStoredTypes().empty());
  assert(coll.Size() == 0);
  assert(coll.Iterate().Collect().empty());
}

void TestMarkerLayout() {
  auto                repo = std::make_shared<MemoryRepository>();
  MultiTypeCollection coll(MakeContext(repo), "/c");

  auto v = Int(1);
  coll.Add(&v, {.timestamp_us = 77, .suffix = 1});
  coll.Add(&v, {.timestamp_us = 78, .suffix = 1});

  auto tx  = repo->Begin();
  auto row = repo->ResolveRow(*tx, "/c");
  tx->Commit();

  assert(row.size() == 1);
  assert(row[0].attribute == std::string("typelog:value_type_") + kInt);
  assert(row[0].value == "1");
  assert(row[0].timestamp_us == 0);
}

} // namespace

int main() {
  TestScenario();
  TestRoutingAndTypeIsolation();
  TestEnvelopesKeepTheirMetadata();
  TestEqualTimestampsNeverOverwrite();
  TestCountConsistency();
  TestScanWithoutSuffix();
  TestNullPayloadIsRejectedWithoutWrites();
  TestStaticAddNeedsNoInstance();
  TestBatchedAddLandsTogether();
  TestFailedMarkerWriteLeavesEntryReadableByType();
  TestMarkerLayout();

  std::cout << "typelog_unit_multi_type_collection: pass\n";
  return 0;
}
