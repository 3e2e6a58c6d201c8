#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace typelog::collection {

// Suffixes are 24-bit; generated ones are drawn from [1, kMaxSuffix].
inline constexpr uint32_t kMaxSuffix = 0xFFFFFF;

/*
  OrderingKey

  Position of an entry inside one sequence: microsecond timestamp, with a
  suffix breaking ties between entries written at the same instant.
  Ordered lexicographically (timestamp, then suffix).
*/
struct OrderingKey {
  uint64_t timestamp_us = 0;
  uint32_t suffix       = 0;

  auto operator<=>(const OrderingKey&) const = default;
};

// Fixed-width "%016x.%06x" form; bytewise order equals key order.
std::string EncodeOrderingKey(const OrderingKey& key);
std::optional<OrderingKey> DecodeOrderingKey(std::string_view encoded);

// Human form "<timestamp>.<suffix>" in decimal, as used by typelogctl.
std::string ToString(const OrderingKey& key);
std::optional<OrderingKey> ParseOrderingKey(std::string_view text);

} // namespace typelog::collection
