#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/quantity/big_uint.hpp"

namespace claimctl::quantity {

// Unit family a literal was written in. Decides how String() renders it.
enum class Format : std::uint8_t {
  kDecimalExponent = 0, // 12e6
  kBinarySI        = 1, // 12Mi
  kDecimalSI       = 2, // 12M
};

/*
  Exact storage quantity.

  The value is sign * mantissa * 10^exp10 * 2^exp2 with an arbitrary-precision
  mantissa, so no literal is ever rounded. Comparison is numeric: "1Gi" equals
  "1024Mi" and "1G" is less than "1Gi".

  Accepted literals: an optionally signed decimal number followed by a binary
  suffix (Ki Mi Gi Ti Pi Ei), a decimal suffix (n u m k K M G T P E, or none
  for base units) or an exponent (e3, E-2).
*/
class Capacity {
 public:
  Capacity() = default;

  // Throws util::ParseError naming raw when it does not match the grammar.
  static Capacity Parse(std::string_view raw);

  // -1, 0 or 1.
  int Compare(const Capacity& other) const;

  // Canonical form in the literal's unit family: "1024Mi" -> "1Gi", "1000M" -> "1G".
  std::string String() const;

  Format format() const {
    return format_;
  }

  bool IsZero() const {
    return mantissa_.IsZero();
  }

 private:
  bool    negative_ = false;
  BigUint mantissa_;
  int     exp10_  = 0;
  int     exp2_   = 0;
  Format  format_ = Format::kDecimalSI;
};

inline bool operator==(const Capacity& a, const Capacity& b) {
  return a.Compare(b) == 0;
}
inline bool operator!=(const Capacity& a, const Capacity& b) {
  return a.Compare(b) != 0;
}
inline bool operator<(const Capacity& a, const Capacity& b) {
  return a.Compare(b) < 0;
}
inline bool operator<=(const Capacity& a, const Capacity& b) {
  return a.Compare(b) <= 0;
}
inline bool operator>(const Capacity& a, const Capacity& b) {
  return a.Compare(b) > 0;
}
inline bool operator>=(const Capacity& a, const Capacity& b) {
  return a.Compare(b) >= 0;
}

} // namespace claimctl::quantity
