#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace claimctl::quantity {

/*
  Unsigned arbitrary-precision integer.

  Little-endian base 10^9 limbs. Only the operations capacity arithmetic
  needs: scaling by small factors and powers, exact small division and
  comparison. An empty limb vector is zero.
*/
class BigUint {
 public:
  BigUint() = default;

  // digits must contain only '0'-'9'; leading zeros are allowed.
  static BigUint FromDigits(std::string_view digits);

  bool IsZero() const {
    return limbs_.empty();
  }

  void MultiplySmall(std::uint32_t factor);
  void MultiplyPow10(unsigned exponent);
  void MultiplyPow2(unsigned exponent);

  // Divides in place and returns the remainder.
  std::uint32_t DivideSmall(std::uint32_t divisor);

  bool IsDivisibleBy(std::uint32_t divisor) const;

  std::string ToString() const;

  static int Compare(const BigUint& a, const BigUint& b);

 private:
  void Trim();

  std::vector<std::uint32_t> limbs_;
};

} // namespace claimctl::quantity
