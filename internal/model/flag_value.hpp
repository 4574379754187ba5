#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace runtrack::model {

/*
  Scalar flag value. std::monostate is the "none" sentinel: the flag is
  passed as a bare option with no value.
*/
using FlagValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

// Ordered by name so every consumer sees flags lexicographically.
using FlagMap = std::map<std::string, FlagValue>;

inline bool IsNone(const FlagValue& value) {
  return std::holds_alternative<std::monostate>(value);
}

// Text form used on the command line. Not meaningful for the none sentinel.
std::string FlagValueText(const FlagValue& value);

// Typed value of a plain scalar typed by a user, e.g. "0.1", "true", "abc".
FlagValue ParseFlagValue(const std::string& text);

} // namespace runtrack::model
