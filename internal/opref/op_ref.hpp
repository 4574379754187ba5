#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/opdef.hpp"

namespace runtrack::run {
class Run;
}

namespace runtrack::opref {

/*
  Operation reference

  Identifies which operation, of which model, from which package
  produced a run. Every field may be unknown.

  Canonical form (persisted as the run's "opref" attribute):

      {pkg_type}:{pkg_name} {pkg_version} {model_name} {op_name}

  with "?" for unknown fields. Parsing the canonical form maps "?" back
  to unknown, so a real field spelled "?" does not survive a round trip.
  Neither does a field containing whitespace.
*/
struct OpRef {
  std::optional<std::string> pkg_type;
  std::optional<std::string> pkg_name;
  std::optional<std::string> pkg_version;
  std::optional<std::string> model_name;
  std::optional<std::string> op_name;

  static OpRef FromOperation(const std::string& op_name, const model::ModelRef& model_ref);

  // Throws util::ReferenceError if the attribute is missing or malformed.
  static OpRef FromRunAttribute(const run::Run& run);

  // Parses the canonical form. `source` names the origin in errors.
  static OpRef FromCanonical(std::string_view text, const std::string& source);

  std::string ToString() const;

  bool IsFullyKnown() const {
    return pkg_type && pkg_name && pkg_version && model_name && op_name;
  }

  bool operator==(const OpRef& other) const {
    return pkg_type == other.pkg_type && pkg_name == other.pkg_name && pkg_version == other.pkg_version &&
           model_name == other.model_name && op_name == other.op_name;
  }

  bool operator!=(const OpRef& other) const {
    return !(*this == other);
  }
};

struct ParsedOpRef {
  OpRef       ref;
  std::string extra;
};

/*
  Parses a user-typed reference: [[pkg_name/]model_name:]op_name[extra]

  op_name is [A-Za-z0-9_.-]+. Whatever follows it is returned as
  `extra`. pkg_type and pkg_version are always unknown.

  Throws util::ReferenceError when no op_name can be matched.
*/
ParsedOpRef FromFreeString(std::string_view text);

} // namespace runtrack::opref
