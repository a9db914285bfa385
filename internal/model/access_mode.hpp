#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace claimctl::model {

enum class AccessMode : std::uint8_t {
  kReadOnlyMany  = 0,
  kReadWriteMany = 1,
  kReadWriteOnce = 2,
};

inline constexpr std::array<AccessMode, 3> kAllAccessModes = {
    AccessMode::kReadOnlyMany,
    AccessMode::kReadWriteMany,
    AccessMode::kReadWriteOnce,
};

constexpr std::string_view ToString(AccessMode mode) {
  switch (mode) {
    case AccessMode::kReadOnlyMany:
      return "ReadOnlyMany";
    case AccessMode::kReadWriteMany:
      return "ReadWriteMany";
    case AccessMode::kReadWriteOnce:
    default:
      return "ReadWriteOnce";
  }
}

// Exact, case-sensitive match against the wire names.
constexpr std::optional<AccessMode> ParseAccessMode(std::string_view token) {
  for (const auto mode : kAllAccessModes) {
    if (ToString(mode) == token) {
      return mode;
    }
  }
  return std::nullopt;
}

} // namespace claimctl::model
