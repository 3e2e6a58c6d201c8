#pragma once

#include <cstdint>
#include <string>

namespace typelog::db::model {

// One (subject, attribute) cell of the attribute store.
struct AttributeRecord {
  std::string subject;
  std::string attribute;
  std::string value;  // opaque bytes
  uint64_t    timestamp_us = 0;
};

} // namespace typelog::db::model
