#include "internal/collection/multi_type_collection.hpp"

#include <google/protobuf/wrappers.pb.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/deletion_pool.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using typelog::collection::CollectionContext;
using typelog::collection::MultiTypeCollection;
using typelog::collection::SequentialCollection;
using typelog::collection::TypeSequenceAdapter;
using typelog::db::DeletionPool;
using typelog::db::memory::MemoryRepository;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  std::shared_ptr<SequentialCollection> sequences = std::make_shared<SequentialCollection>(repo, 2);
  CollectionContext ctx{.repository = repo, .sequences = std::make_shared<TypeSequenceAdapter>(sequences)};
};

google::protobuf::StringValue Str(const std::string& v) {
  google::protobuf::StringValue m;
  m.set_value(v);
  return m;
}

void TestOnDeleteRegistersEverySequence() {
  Fixture             f;
  MultiTypeCollection coll(f.ctx, "/hunt/results", {.username = "admin", .reason = "cleanup"});

  auto s = Str("s");
  for (uint32_t i = 1; i <= 5; ++i) {
    coll.Add(&s, {.timestamp_us = i, .suffix = i});
  }
  google::protobuf::Int64Value n;
  n.set_value(1);
  coll.Add(&n, {.timestamp_us = 1, .suffix = 1});

  // A sequence appended to directly has no marker on the collection row.
  f.sequences->Append(TypeSequenceAdapter::SequenceUrn("/hunt/results", "orphan.Type"), typelog::v1::Envelope(), {3, 3});
  assert(!coll.ListStoredTypes().contains("orphan.Type"));

  DeletionPool pool(f.repo);
  coll.OnDelete(pool);

  const std::vector<std::string> expected = {"/hunt/results/google.protobuf.Int64Value",
                                             "/hunt/results/google.protobuf.StringValue", "/hunt/results/orphan.Type"};
  assert(pool.Marked() == expected);
  assert(!pool.IsMarked("/hunt/results"));

  // marking alone deletes nothing
  assert(coll.Size() == 6);
}

void TestFlushRemovesSequencesAndCollectionRow() {
  Fixture             f;
  MultiTypeCollection coll(f.ctx, "/c");
  MultiTypeCollection neighbour(f.ctx, "/c2");

  auto s = Str("s");
  coll.Add(&s, {.timestamp_us = 1, .suffix = 1});
  neighbour.Add(&s, {.timestamp_us = 1, .suffix = 1});

  DeletionPool pool(f.repo);
  pool.MarkForDeletion(coll.urn());
  coll.OnDelete(pool);
  pool.Flush();

  assert(pool.Marked().empty());
  assert(coll.ListStoredTypes().empty());
  assert(coll.LengthByType("google.protobuf.StringValue") == 0);
  assert(coll.Size() == 0);

  assert(neighbour.Size() == 1);
}

void TestOnDeleteOfEmptyCollection() {
  Fixture             f;
  MultiTypeCollection coll(f.ctx, "/empty");

  DeletionPool pool(f.repo);
  coll.OnDelete(pool);
  assert(pool.Marked().empty());

  pool.Flush();
}

void TestEmptyUrnCannotBeMarked() {
  Fixture      f;
  DeletionPool pool(f.repo);

  bool threw = false;
  try {
    pool.MarkForDeletion("");
  } catch (const typelog::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOnDeleteRegistersEverySequence();
  TestFlushRemovesSequencesAndCollectionRow();
  TestOnDeleteOfEmptyCollection();
  TestEmptyUrnCannotBeMarked();

  std::cout << "typelog_unit_multi_type_collection_delete: pass\n";
  return 0;
}
