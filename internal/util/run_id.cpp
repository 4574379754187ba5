#include "run_id.hpp"

#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

#include "internal/util/time.hpp"

namespace runtrack::util {

namespace {

std::atomic<uint64_t> g_last_ticks{0};

// Strictly increasing per process, even when the clock stalls or steps back.
uint64_t NextTicks() {
  uint64_t now  = ToGregorianTicks(Now());
  uint64_t last = g_last_ticks.load();
  uint64_t next = 0;
  do {
    next = now > last ? now : last + 1;
  } while (!g_last_ticks.compare_exchange_weak(last, next));
  return next;
}

} // namespace

UUID GenerateTimeUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  const uint64_t ticks     = NextTicks() & 0x0FFFFFFFFFFFFFFFULL;
  const uint32_t time_low  = static_cast<uint32_t>(ticks & 0xFFFFFFFFULL);
  const uint16_t time_mid  = static_cast<uint16_t>((ticks >> 32) & 0xFFFF);
  const uint16_t time_high = static_cast<uint16_t>((ticks >> 48) & 0x0FFF);
  const uint64_t random    = rng();

  UUID id{};
  id[0] = static_cast<uint8_t>(time_low >> 24);
  id[1] = static_cast<uint8_t>(time_low >> 16);
  id[2] = static_cast<uint8_t>(time_low >> 8);
  id[3] = static_cast<uint8_t>(time_low);
  id[4] = static_cast<uint8_t>(time_mid >> 8);
  id[5] = static_cast<uint8_t>(time_mid);
  id[6] = static_cast<uint8_t>(time_high >> 8);
  id[7] = static_cast<uint8_t>(time_high);

  // Clock sequence and node are random; the node gets the multicast bit
  // so it can never collide with a real MAC address.
  for (size_t i = 8; i < id.size(); ++i)
    id[i] = static_cast<uint8_t>(random >> ((i - 8) * 8));

  id[6] = (id[6] & 0x0F) | 0x10;
  id[8] = (id[8] & 0x3F) | 0x80;
  id[10] |= 0x01;

  return id;
}

std::string ToHex(const UUID& id) {
  std::ostringstream oss;
  for (auto b : id)
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  return oss.str();
}

std::string UniqueRunId() {
  return ToHex(GenerateTimeUUID());
}

} // namespace runtrack::util
