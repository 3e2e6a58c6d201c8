#pragma once

#include <cstdint>
#include <string>

namespace typelog::util {

/*
  Process-wide randomness helpers.

  Each thread owns its generator, so callers never contend on a lock.
*/

// Uniform value in [lo, hi].
uint32_t RandomUint32(uint32_t lo, uint32_t hi);

// RFC4122 version 4 UUID, textual form.
std::string GenerateUuidString();

} // namespace typelog::util
