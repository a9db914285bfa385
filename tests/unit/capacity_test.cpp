#include "internal/quantity/capacity.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace {

using claimctl::quantity::Capacity;
using claimctl::quantity::Format;

Capacity Q(std::string_view raw) {
  return Capacity::Parse(raw);
}

std::string ParseFailure(std::string_view raw) {
  try {
    (void)Capacity::Parse(raw);
  } catch (const claimctl::util::ParseError& e) {
    return e.what();
  }
  return {};
}

void TestEqualMagnitudeAcrossSuffixes() {
  assert(Q("1Gi") == Q("1024Mi"));
  assert(Q("5Gi") == Q("5120Mi"));
  assert(Q("1.5Gi") == Q("1536Mi"));
  assert(Q(".5Gi") == Q("512Mi"));
  assert(Q("1Mi") == Q("1048576"));
  assert(Q("1e3") == Q("1k"));
  assert(Q("1K") == Q("1k"));
  assert(Q("1000M") == Q("1G"));
  assert(Q("+5Gi") == Q("5Gi"));
  assert(Q("0Gi") == Q("0"));
  assert(Q("-0") == Q("0"));
}

void TestBinaryAndDecimalUnitsAreDistinct() {
  assert(Q("1G") != Q("1Gi"));
  assert(Q("1G") < Q("1Gi"));
  assert(Q("1Ki") == Q("1024"));
  assert(Q("1k") < Q("1Ki"));
  assert(Q("1E") < Q("1Ei"));
}

void TestOrdering() {
  assert(Q("1000Mi") < Q("1Gi"));
  assert(Q("1025Mi") > Q("1Gi"));
  assert(Q("999m") < Q("1"));
  assert(Q("1n") > Q("0"));
  assert(Q("-1Gi") < Q("0"));
  assert(Q("-1Gi") < Q("-1Mi"));
  assert(Q("2Ti") >= Q("2048Gi"));
  assert(Q("2Ti") <= Q("2048Gi"));
  assert(Q("1e-3").Compare(Q("1m")) == 0);
  assert(Q("10Gi").Compare(Q("5Gi")) == 1);
  assert(Q("5Gi").Compare(Q("10Gi")) == -1);
}

void TestLargeValuesStayExact() {
  // Far beyond 64-bit range; exactness must hold at the last digit.
  assert(Q("100000000000000000000Ei") > Q("99999999999999999999Ei"));
  assert(Q("1024Ei") == Q("1048576Pi"));
  assert(Q("123456789123456789123456789") < Q("123456789123456789123456790"));
  assert(Q("1e30") == Q("1000000000000E"));
  assert(Q("0.000000000001") == Q("1e-12"));
}

void TestCanonicalString() {
  assert(Q("1024Mi").String() == "1Gi");
  assert(Q("5120Mi").String() == "5Gi");
  assert(Q("500Mi").String() == "500Mi");
  assert(Q("1.5Gi").String() == "1536Mi");
  assert(Q("0.1Ki").String() == "102400m");
  assert(Q("1000M").String() == "1G");
  assert(Q("1500M").String() == "1500M");
  assert(Q("0.5").String() == "500m");
  assert(Q("100").String() == "100");
  assert(Q("1K").String() == "1k");
  assert(Q("1e3").String() == "1e3");
  assert(Q("12e6").String() == "12e6");
  assert(Q("-5Gi").String() == "-5Gi");
  assert(Q("0Gi").String() == "0");
}

void TestFormatFollowsLiteral() {
  assert(Q("1Gi").format() == Format::kBinarySI);
  assert(Q("1G").format() == Format::kDecimalSI);
  assert(Q("1").format() == Format::kDecimalSI);
  assert(Q("1e9").format() == Format::kDecimalExponent);
  assert(Q("1E").format() == Format::kDecimalSI);
}

void TestRejectsMalformedLiterals() {
  for (const auto* raw : {"", "abc", "Gi", "5GB", "5gi", "1.2.3", " 5Gi", "5Gi ", "5 Gi", "--5", "5e", "1e99999", ".", "+", "0x10"}) {
    assert(!ParseFailure(raw).empty());
  }

  const auto message = ParseFailure("5GB");
  assert(message.find("\"5GB\"") != std::string::npos);

  // Parse failures are also build failures.
  bool threw = false;
  try {
    (void)Capacity::Parse("ten");
  } catch (const claimctl::util::BuildError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEqualMagnitudeAcrossSuffixes();
  TestBinaryAndDecimalUnitsAreDistinct();
  TestOrdering();
  TestLargeValuesStayExact();
  TestCanonicalString();
  TestFormatFollowsLiteral();
  TestRejectsMalformedLiterals();

  std::cout << "claimctl_unit_capacity: pass\n";
  return 0;
}
