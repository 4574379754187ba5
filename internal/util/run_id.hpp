#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace runtrack::util {

/*
  Run id helpers

  Run ids are RFC4122 version-1 UUIDs rendered as 32 lowercase hex
  characters with no separators.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateTimeUUID();

std::string ToHex(const UUID& id);

// Fresh, never reused run id.
std::string UniqueRunId();

} // namespace runtrack::util
