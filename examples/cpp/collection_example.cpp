#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/wrappers.pb.h>

#include <iostream>
#include <string>

#include "internal/collection/multi_type_collection.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/deletion_pool.hpp"
#include "internal/db/mutation_pool.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using typelog::collection::MultiTypeCollection;

int main(int argc, char** argv) {
  // Optional config argument; an in-memory store is used otherwise.
  auto config = argc > 1 ? typelog::config::ConfigLoader::LoadFromYaml(argv[1])
                         : typelog::config::ConfigLoader::LoadFromYamlString("");
  typelog::observability::InitializeLogging(config);

  try {
    auto deps = typelog::factory::BuildRuntime(config);

    MultiTypeCollection results(deps.collections, "/hunts/H:1234/results", {.username = "example", .reason = "demo"});

    // Heterogeneous writes to one logical name.
    google::protobuf::StringValue hostname;
    hostname.set_value("workstation-17");
    results.Add(&hostname);

    google::protobuf::Int64Value process_count;
    process_count.set_value(212);
    results.Add(&process_count);

    // Batched writes reach the store together.
    typelog::db::MutationPool batch(deps.repository);
    for (int i = 0; i < 3; ++i) {
      google::protobuf::Timestamp seen;
      seen.set_seconds(1700000000 + i);
      results.Add(&seen, {}, &batch);
    }
    batch.Flush();

    std::cout << "stored types:\n";
    for (const auto& type_name : results.ListStoredTypes()) {
      std::cout << "  " << type_name << " (" << results.LengthByType(type_name) << ")\n";
    }
    std::cout << "total entries: " << results.Size() << "\n";

    auto cursor = results.ScanByType("google.protobuf.Timestamp");
    while (auto entry = cursor.Next()) {
      google::protobuf::Timestamp seen;
      if (entry->value.payload().UnpackTo(&seen)) {
        std::cout << "  " << typelog::collection::ToString(entry->key) << " -> " << seen.seconds() << "\n";
      }
    }

    typelog::db::DeletionPool deletion(deps.repository);
    deletion.MarkForDeletion(results.urn());
    results.OnDelete(deletion);
    deletion.Flush();
    std::cout << "after delete: " << results.Size() << " entries\n";
  } catch (const std::exception& e) {
    TYPELOG_LOG_ERROR("example failed", {typelog::observability::StringField("error", e.what())});
    typelog::observability::ShutdownLogging();
    return 1;
  }

  typelog::observability::ShutdownLogging();
  return 0;
}
