#pragma once

#include <chrono>
#include <cstdint>

namespace runtrack::util {

/*
  Time utilities: single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixSeconds(TimePoint tp);

// 100ns intervals since 1582-10-15, the RFC 4122 version-1 clock.
std::uint64_t ToGregorianTicks(TimePoint tp);

} // namespace runtrack::util
