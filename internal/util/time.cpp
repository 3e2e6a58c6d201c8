#include "time.hpp"

namespace typelog::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMicros(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count());
}

TimePoint FromUnixMicros(uint64_t micros) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
}

uint64_t NowMicros() {
  return ToUnixMicros(Now());
}

} // namespace typelog::util
