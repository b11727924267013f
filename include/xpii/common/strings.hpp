#pragma once

#include <string_view>

namespace xpii::common {

inline constexpr auto kWhitespace = std::string_view{" \t\r\n\f\v"};

/// Strip leading and trailing ASCII whitespace.
inline std::string_view trim(const std::string_view value) {
  auto begin = value.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = value.find_last_not_of(kWhitespace);
  return value.substr(begin, end - begin + 1);
}

}  // namespace xpii::common
