#include "snowweb/url-decode.hpp"

#include <cstddef>
#include <string>

namespace snowweb::url {

namespace {

constexpr int FromHexDigit(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

bool DecodePathInPlace(std::string& str) {
  std::size_t out = 0;
  for (std::size_t pos = 0; pos < str.size(); ++pos) {
    char ch = str[pos];
    if (ch == '%') {
      if (pos + 2 >= str.size()) {
        return false;
      }
      const int hi = FromHexDigit(str[pos + 1]);
      const int lo = FromHexDigit(str[pos + 2]);
      if (hi < 0 || lo < 0) {
        return false;
      }
      ch = static_cast<char>((hi << 4) | lo);
      pos += 2;
    }
    str[out++] = ch;
  }
  str.resize(out);
  return true;
}

}  // namespace snowweb::url
