#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace runtrack::storage {

inline void ValidatePathComponent(const std::string& name, const std::string& what) {
  if (name.empty()) {
    throw std::invalid_argument(what + " must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(what + " contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument(what + " must not be a relative path component");
  }
}

inline std::filesystem::path RunPath(const std::filesystem::path& root, const std::string& run_id) {
  ValidatePathComponent(run_id, "run id");
  return root / run_id;
}

} // namespace runtrack::storage
