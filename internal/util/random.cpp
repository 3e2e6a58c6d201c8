#include "random.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace typelog::util {

namespace {

std::mt19937_64& Generator() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

uint32_t RandomUint32(uint32_t lo, uint32_t hi) {
  std::uniform_int_distribution<uint32_t> dist(lo, hi);
  return dist(Generator());
}

std::string GenerateUuidString() {
  std::array<uint8_t, 16> id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(Generator()());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  std::ostringstream oss;
  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

} // namespace typelog::util
