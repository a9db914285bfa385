#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace claimctl::util {

/*
  Splits on every separator. Empty fields are kept, so "a,,b" yields three
  tokens and "a," yields two.
*/
inline std::vector<std::string> Split(std::string_view text, char separator) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (true) {
    const auto pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(text.substr(start));
      return parts;
    }
    parts.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace claimctl::util
