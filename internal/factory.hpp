#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/collection/multi_type_collection.hpp"
#include "internal/db/api/repository.hpp"

namespace typelog::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects used by a typelog process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  collection::CollectionContext collections;
};

/*
  BuildRuntime

  Constructs the store and the collection stack from runtime config and
  bootstraps the store schema.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const typelog::runtime::config::RuntimeConfig& config);

} // namespace typelog::factory
