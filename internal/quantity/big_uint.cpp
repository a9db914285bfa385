#include "big_uint.hpp"

#include <stdexcept>

namespace claimctl::quantity {

namespace {

constexpr std::uint32_t kBase       = 1'000'000'000;
constexpr std::size_t   kLimbDigits = 9;

constexpr std::uint32_t kPow10[] = {1, 10, 100, 1'000, 10'000, 100'000, 1'000'000, 10'000'000, 100'000'000};

} // namespace

BigUint BigUint::FromDigits(std::string_view digits) {
  BigUint     out;
  std::size_t end = digits.size();
  while (end > 0) {
    const std::size_t begin = end >= kLimbDigits ? end - kLimbDigits : 0;
    std::uint32_t     limb  = 0;
    for (std::size_t i = begin; i < end; ++i) {
      limb = limb * 10 + static_cast<std::uint32_t>(digits[i] - '0');
    }
    out.limbs_.push_back(limb);
    end = begin;
  }
  out.Trim();
  return out;
}

void BigUint::MultiplySmall(std::uint32_t factor) {
  if (factor == 0) {
    limbs_.clear();
    return;
  }

  std::uint64_t carry = 0;
  for (auto& limb : limbs_) {
    const std::uint64_t cur = static_cast<std::uint64_t>(limb) * factor + carry;
    limb                    = static_cast<std::uint32_t>(cur % kBase);
    carry                   = cur / kBase;
  }
  while (carry != 0) {
    limbs_.push_back(static_cast<std::uint32_t>(carry % kBase));
    carry /= kBase;
  }
}

void BigUint::MultiplyPow10(unsigned exponent) {
  while (exponent >= kLimbDigits) {
    MultiplySmall(kBase);
    exponent -= kLimbDigits;
  }
  MultiplySmall(kPow10[exponent]);
}

void BigUint::MultiplyPow2(unsigned exponent) {
  // 2^29 is the largest power of two below kBase.
  while (exponent >= 29) {
    MultiplySmall(1u << 29);
    exponent -= 29;
  }
  MultiplySmall(1u << exponent);
}

std::uint32_t BigUint::DivideSmall(std::uint32_t divisor) {
  if (divisor == 0) {
    throw std::invalid_argument("division by zero");
  }

  std::uint64_t remainder = 0;
  for (auto it = limbs_.rbegin(); it != limbs_.rend(); ++it) {
    const std::uint64_t cur = remainder * kBase + *it;
    *it                     = static_cast<std::uint32_t>(cur / divisor);
    remainder               = cur % divisor;
  }
  Trim();
  return static_cast<std::uint32_t>(remainder);
}

bool BigUint::IsDivisibleBy(std::uint32_t divisor) const {
  BigUint copy = *this;
  return copy.DivideSmall(divisor) == 0;
}

std::string BigUint::ToString() const {
  if (limbs_.empty()) {
    return "0";
  }

  std::string out = std::to_string(limbs_.back());
  for (auto it = limbs_.rbegin() + 1; it != limbs_.rend(); ++it) {
    const auto limb = std::to_string(*it);
    out.append(kLimbDigits - limb.size(), '0');
    out += limb;
  }
  return out;
}

int BigUint::Compare(const BigUint& a, const BigUint& b) {
  if (a.limbs_.size() != b.limbs_.size()) {
    return a.limbs_.size() < b.limbs_.size() ? -1 : 1;
  }
  for (std::size_t i = a.limbs_.size(); i-- > 0;) {
    if (a.limbs_[i] != b.limbs_[i]) {
      return a.limbs_[i] < b.limbs_[i] ? -1 : 1;
    }
  }
  return 0;
}

void BigUint::Trim() {
  while (!limbs_.empty() && limbs_.back() == 0) {
    limbs_.pop_back();
  }
}

} // namespace claimctl::quantity
