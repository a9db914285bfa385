#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace claimctl::store::common {

inline void ValidatePathComponent(const std::string& what, const std::string& value) {
  if (value.empty()) {
    throw std::invalid_argument(what + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(what + " contains invalid character");
    }
  }
  if (value == "." || value == "..") {
    throw std::invalid_argument(what + " must not be a relative path component");
  }
}

inline std::filesystem::path ClaimPath(const std::filesystem::path& root, const std::string& namespace_name, const std::string& name) {
  ValidatePathComponent("namespace", namespace_name);
  ValidatePathComponent("claim name", name);
  return root / namespace_name / (name + ".json");
}

} // namespace claimctl::store::common
