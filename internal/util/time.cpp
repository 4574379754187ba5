#include "time.hpp"

namespace runtrack::util {

namespace {

// Offset between 1582-10-15 and 1970-01-01 in 100ns units.
constexpr std::uint64_t kGregorianOffset = 0x01B21DD213814000ULL;

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::uint64_t ToGregorianTicks(TimePoint tp) {
  auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
  return static_cast<std::uint64_t>(ns / 100) + kGregorianOffset;
}

} // namespace runtrack::util
