#include "internal/collection/ordering_key.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace typelog::collection {

namespace {

template <typename T>
bool ParseNumber(std::string_view text, int base, T& out) {
  if (text.empty()) {
    return false;
  }
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, out, base);
  return ec == std::errc() && ptr == end;
}

} // namespace

std::string EncodeOrderingKey(const OrderingKey& key) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << key.timestamp_us << '.' << std::setw(6) << key.suffix;
  return oss.str();
}

std::optional<OrderingKey> DecodeOrderingKey(std::string_view encoded) {
  if (encoded.size() != 23 || encoded[16] != '.') {
    return std::nullopt;
  }

  OrderingKey key;
  if (!ParseNumber(encoded.substr(0, 16), 16, key.timestamp_us) || !ParseNumber(encoded.substr(17), 16, key.suffix)) {
    return std::nullopt;
  }
  return key;
}

std::string ToString(const OrderingKey& key) {
  return std::to_string(key.timestamp_us) + "." + std::to_string(key.suffix);
}

std::optional<OrderingKey> ParseOrderingKey(std::string_view text) {
  OrderingKey key;
  const auto  dot = text.find('.');
  if (!ParseNumber(text.substr(0, dot), 10, key.timestamp_us)) {
    return std::nullopt;
  }
  if (dot != std::string_view::npos && (!ParseNumber(text.substr(dot + 1), 10, key.suffix) || key.suffix > kMaxSuffix)) {
    return std::nullopt;
  }
  return key;
}

} // namespace typelog::collection
