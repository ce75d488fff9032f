#pragma once

#include <string_view>

namespace snowweb {

// Optional white space as defined by RFC 9110: SP / HTAB.
constexpr bool IsOws(char ch) noexcept { return ch == ' ' || ch == '\t'; }

constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && IsOws(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && IsOws(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

}  // namespace snowweb
