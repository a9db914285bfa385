#include "capacity.hpp"

#include <algorithm>
#include <array>
#include <optional>

#include "internal/util/errors.hpp"

namespace claimctl::quantity {

namespace {

// Bounds exponent literals so "1e999999999" cannot demand a gigantic mantissa.
constexpr int kMaxExponent = 1024;

constexpr std::array<std::string_view, 7> kBinarySuffixes = {"", "Ki", "Mi", "Gi", "Ti", "Pi", "Ei"};

struct Suffix {
  Format format = Format::kDecimalSI;
  int    exp10  = 0;
  int    exp2   = 0;
};

[[noreturn]] void Fail(std::string_view raw, const std::string& reason) {
  throw util::ParseError("unable to parse quantity \"" + std::string(raw) + "\": " + reason);
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

std::optional<int> ParseExponent(std::string_view text) {
  bool        negative = false;
  std::size_t pos      = 0;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }
  if (pos == text.size()) {
    return std::nullopt;
  }

  int value = 0;
  for (; pos < text.size(); ++pos) {
    if (!IsDigit(text[pos])) {
      return std::nullopt;
    }
    value = value * 10 + (text[pos] - '0');
    if (value > kMaxExponent) {
      return std::nullopt;
    }
  }
  return negative ? -value : value;
}

std::optional<Suffix> ParseSuffix(std::string_view text) {
  for (std::size_t i = 1; i < kBinarySuffixes.size(); ++i) {
    if (text == kBinarySuffixes[i]) {
      return Suffix{Format::kBinarySI, 0, static_cast<int>(10 * i)};
    }
  }

  if (text.size() <= 1) {
    switch (text.empty() ? '\0' : text[0]) {
      case '\0':
        return Suffix{Format::kDecimalSI, 0, 0};
      case 'n':
        return Suffix{Format::kDecimalSI, -9, 0};
      case 'u':
        return Suffix{Format::kDecimalSI, -6, 0};
      case 'm':
        return Suffix{Format::kDecimalSI, -3, 0};
      case 'k':
      case 'K':
        return Suffix{Format::kDecimalSI, 3, 0};
      case 'M':
        return Suffix{Format::kDecimalSI, 6, 0};
      case 'G':
        return Suffix{Format::kDecimalSI, 9, 0};
      case 'T':
        return Suffix{Format::kDecimalSI, 12, 0};
      case 'P':
        return Suffix{Format::kDecimalSI, 15, 0};
      case 'E':
        return Suffix{Format::kDecimalSI, 18, 0};
      default:
        return std::nullopt;
    }
  }

  if (text[0] == 'e' || text[0] == 'E') {
    if (auto exponent = ParseExponent(text.substr(1))) {
      return Suffix{Format::kDecimalExponent, *exponent, 0};
    }
  }
  return std::nullopt;
}

int FloorToMultipleOf3(int value) {
  const int quotient = value >= 0 ? value / 3 : -((-value + 2) / 3);
  return quotient * 3;
}

std::string_view DecimalSuffix(int exp10) {
  switch (exp10) {
    case -9:
      return "n";
    case -6:
      return "u";
    case -3:
      return "m";
    case 3:
      return "k";
    case 6:
      return "M";
    case 9:
      return "G";
    case 12:
      return "T";
    case 15:
      return "P";
    case 18:
      return "E";
    default:
      return "";
  }
}

// Whole-number binary rendering, or nullopt when the value has a fraction.
std::optional<std::string> BinaryString(BigUint value, int exp10, int exp2) {
  value.MultiplyPow2(static_cast<unsigned>(exp2));
  if (exp10 >= 0) {
    value.MultiplyPow10(static_cast<unsigned>(exp10));
  } else {
    for (int i = 0; i < -exp10; ++i) {
      if (value.DivideSmall(10) != 0) {
        return std::nullopt;
      }
    }
  }

  std::size_t index = 0;
  while (index + 1 < kBinarySuffixes.size() && !value.IsZero() && value.IsDivisibleBy(1024)) {
    value.DivideSmall(1024);
    ++index;
  }
  return value.ToString() + std::string(kBinarySuffixes[index]);
}

std::string DecimalString(BigUint value, int exp10, int exp2, bool exponent_form) {
  value.MultiplyPow2(static_cast<unsigned>(exp2));
  while (!value.IsZero() && value.IsDivisibleBy(10)) {
    value.DivideSmall(10);
    ++exp10;
  }

  int scale = FloorToMultipleOf3(exp10);
  if (!exponent_form) {
    scale = std::clamp(scale, -9, 18);
    // Below nano there is no suffix left; keep the value exact.
    if (exp10 < scale) {
      exponent_form = true;
      scale         = FloorToMultipleOf3(exp10);
    }
  }

  value.MultiplyPow10(static_cast<unsigned>(exp10 - scale));
  std::string out = value.ToString();
  if (exponent_form) {
    if (scale != 0) {
      out += "e" + std::to_string(scale);
    }
  } else {
    out += DecimalSuffix(scale);
  }
  return out;
}

} // namespace

Capacity Capacity::Parse(std::string_view raw) {
  if (raw.empty()) {
    Fail(raw, "empty string");
  }

  Capacity    capacity;
  std::size_t pos = 0;
  if (raw[pos] == '+' || raw[pos] == '-') {
    capacity.negative_ = raw[pos] == '-';
    ++pos;
  }

  std::string digits;
  int         fraction_digits = 0;
  bool        seen_dot        = false;
  for (; pos < raw.size(); ++pos) {
    const char c = raw[pos];
    if (IsDigit(c)) {
      digits.push_back(c);
      if (seen_dot) {
        ++fraction_digits;
      }
    } else if (c == '.' && !seen_dot) {
      seen_dot = true;
    } else {
      break;
    }
  }
  if (digits.empty()) {
    Fail(raw, "missing numeric value");
  }

  const auto suffix_text = raw.substr(pos);
  const auto suffix      = ParseSuffix(suffix_text);
  if (!suffix) {
    Fail(raw, "unknown suffix \"" + std::string(suffix_text) + "\"");
  }

  capacity.mantissa_ = BigUint::FromDigits(digits);
  capacity.exp10_    = suffix->exp10 - fraction_digits;
  capacity.exp2_     = suffix->exp2;
  capacity.format_   = suffix->format;
  if (capacity.mantissa_.IsZero()) {
    capacity.negative_ = false;
  }
  return capacity;
}

int Capacity::Compare(const Capacity& other) const {
  const int sign       = IsZero() ? 0 : (negative_ ? -1 : 1);
  const int other_sign = other.IsZero() ? 0 : (other.negative_ ? -1 : 1);
  if (sign != other_sign) {
    return sign < other_sign ? -1 : 1;
  }
  if (sign == 0) {
    return 0;
  }

  // Scale both sides onto the smaller exponents so they become plain integers.
  const int exp10 = std::min(exp10_, other.exp10_);
  const int exp2  = std::min(exp2_, other.exp2_);

  BigUint lhs = mantissa_;
  lhs.MultiplyPow10(static_cast<unsigned>(exp10_ - exp10));
  lhs.MultiplyPow2(static_cast<unsigned>(exp2_ - exp2));

  BigUint rhs = other.mantissa_;
  rhs.MultiplyPow10(static_cast<unsigned>(other.exp10_ - exp10));
  rhs.MultiplyPow2(static_cast<unsigned>(other.exp2_ - exp2));

  const int magnitude = BigUint::Compare(lhs, rhs);
  return sign < 0 ? -magnitude : magnitude;
}

std::string Capacity::String() const {
  if (IsZero()) {
    return "0";
  }

  const std::string sign = negative_ ? "-" : "";
  if (format_ == Format::kBinarySI) {
    if (auto binary = BinaryString(mantissa_, exp10_, exp2_)) {
      return sign + *binary;
    }
  }
  return sign + DecimalString(mantissa_, exp10_, exp2_, format_ == Format::kDecimalExponent);
}

} // namespace claimctl::quantity
