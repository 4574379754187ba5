#include "internal/model/flag_value.hpp"

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstdlib>

namespace runtrack::model {

namespace {

struct TextVisitor {
  std::string operator()(std::monostate) const {
    return {};
  }
  std::string operator()(bool value) const {
    return value ? "true" : "false";
  }
  std::string operator()(std::int64_t value) const {
    return std::to_string(value);
  }
  // Integral doubles keep a ".0" so they stay floats on the command line.
  std::string operator()(double value) const {
    auto text = fmt::format("{}", value);
    if (text.find_first_of(".en") == std::string::npos) {
      text += ".0";
    }
    return text;
  }
  std::string operator()(const std::string& value) const {
    return value;
  }
};

} // namespace

std::string FlagValueText(const FlagValue& value) {
  return std::visit(TextVisitor{}, value);
}

FlagValue ParseFlagValue(const std::string& text) {
  if (text.empty() || text == "~" || text == "null") {
    return std::monostate{};
  }
  if (text == "true" || text == "false") {
    return text == "true";
  }

  char* end = nullptr;
  errno     = 0;
  const long long as_int = std::strtoll(text.c_str(), &end, 10);
  if (end && *end == '\0' && errno == 0) {
    return static_cast<std::int64_t>(as_int);
  }

  // Decimal notation only; no hex, inf or nan.
  if (text.find_first_not_of("0123456789+-.eE") != std::string::npos) {
    return text;
  }

  end = nullptr;
  const double as_double = std::strtod(text.c_str(), &end);
  if (end && *end == '\0') {
    return as_double;
  }

  return text;
}

} // namespace runtrack::model
