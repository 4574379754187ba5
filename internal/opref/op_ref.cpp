#include "internal/opref/op_ref.hpp"

#include <cctype>

#include "internal/run/run.hpp"
#include "internal/util/errors.hpp"

namespace runtrack::opref {

namespace {

constexpr char kUnknown[] = "?";

std::string FieldText(const std::optional<std::string>& field) {
  return field ? *field : kUnknown;
}

std::optional<std::string> FieldValue(std::string_view text) {
  if (text == kUnknown) {
    return std::nullopt;
  }
  return std::string(text);
}

bool IsOpNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

// End of the op name starting at `pos`, or `pos` if none matches.
size_t ScanOpName(std::string_view text, size_t pos) {
  while (pos < text.size() && IsOpNameChar(text[pos])) {
    ++pos;
  }
  return pos;
}

// Maximal run of non-whitespace characters other than `stop`, starting at `pos`.
size_t ScanField(std::string_view text, size_t pos, char stop) {
  while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos])) && text[pos] != stop) {
    ++pos;
  }
  return pos;
}

} // namespace

OpRef OpRef::FromOperation(const std::string& op_name, const model::ModelRef& model_ref) {
  return OpRef{model_ref.pkg_type, model_ref.pkg_name, model_ref.pkg_version, model_ref.model_name, op_name};
}

std::string OpRef::ToString() const {
  return FieldText(pkg_type) + ":" + FieldText(pkg_name) + " " + FieldText(pkg_version) + " " + FieldText(model_name) + " " +
         FieldText(op_name);
}

OpRef OpRef::FromRunAttribute(const run::Run& run) {
  auto attr = run.GetString("opref");
  if (!attr || attr->empty()) {
    throw util::ReferenceError("run " + run.Id() + " does not have attr 'opref'");
  }
  return FromCanonical(*attr, "run " + run.Id());
}

/*
  Grammar:
      pkg_type ':' pkg_name ' ' pkg_version ' ' model_name ' ' op_name ws*

  pkg_type excludes ':' and whitespace; every other field is a maximal
  run of non-whitespace characters.
*/
OpRef OpRef::FromCanonical(std::string_view text, const std::string& source) {
  auto bad = [&]() {
    return util::ReferenceError("bad opref attr for " + source + ": " + std::string(text));
  };

  std::string_view fields[5];
  size_t           pos = 0;

  size_t end = ScanField(text, pos, ':');
  if (end == pos || end >= text.size() || text[end] != ':') {
    throw bad();
  }
  fields[0] = text.substr(pos, end - pos);
  pos       = end + 1;

  for (int i = 1; i < 5; ++i) {
    end = ScanField(text, pos, ' ');
    if (end == pos) {
      throw bad();
    }
    fields[i] = text.substr(pos, end - pos);
    pos       = end;
    if (i < 4) {
      if (pos >= text.size() || text[pos] != ' ') {
        throw bad();
      }
      ++pos;
    }
  }

  for (; pos < text.size(); ++pos) {
    if (!std::isspace(static_cast<unsigned char>(text[pos]))) {
      throw bad();
    }
  }

  return OpRef{FieldValue(fields[0]), FieldValue(fields[1]), FieldValue(fields[2]), FieldValue(fields[3]), FieldValue(fields[4])};
}

/*
  Alternatives are tried in order, first match wins:
    1. pkg '/' model ':' op   (pkg runs to the first '/', model to the next ':')
    2. model ':' op           (model runs to the first ':')
    3. op
*/
ParsedOpRef FromFreeString(std::string_view text) {
  auto make = [&](std::optional<std::string> pkg, std::optional<std::string> model, size_t op_begin, size_t op_end) {
    ParsedOpRef parsed;
    parsed.ref.pkg_name   = std::move(pkg);
    parsed.ref.model_name = std::move(model);
    parsed.ref.op_name    = std::string(text.substr(op_begin, op_end - op_begin));
    parsed.extra          = std::string(text.substr(op_end));
    return parsed;
  };

  const size_t slash = text.find('/');
  if (slash != std::string_view::npos && slash > 0) {
    const size_t colon = text.find(':', slash + 1);
    if (colon != std::string_view::npos && colon > slash + 1) {
      const size_t op_end = ScanOpName(text, colon + 1);
      if (op_end > colon + 1) {
        return make(std::string(text.substr(0, slash)), std::string(text.substr(slash + 1, colon - slash - 1)), colon + 1, op_end);
      }
    }
  }

  const size_t colon = text.find(':');
  if (colon != std::string_view::npos && colon > 0) {
    const size_t op_end = ScanOpName(text, colon + 1);
    if (op_end > colon + 1) {
      return make(std::nullopt, std::string(text.substr(0, colon)), colon + 1, op_end);
    }
  }

  const size_t op_end = ScanOpName(text, 0);
  if (op_end == 0) {
    throw util::ReferenceError("invalid reference: '" + std::string(text) + "'");
  }
  return make(std::nullopt, std::nullopt, 0, op_end);
}

} // namespace runtrack::opref
