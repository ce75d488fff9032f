#include "snowweb/header-lines.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "snowweb/http-header.hpp"
#include "snowweb/string-trim.hpp"

namespace snowweb::http {

namespace {

// RFC 9110 token characters.
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").contains(ch);
}

[[noreturn]] void ThrowMalformed(std::size_t lineNo, const char* reason) {
  throw std::invalid_argument("malformed header line " + std::to_string(lineNo) + ": " + reason);
}

}  // namespace

HeaderList ParseHeaderLines(std::string_view text) {
  HeaderList headers;
  std::size_t lineNo = 0;
  while (!text.empty()) {
    const auto eol = text.find('\n');
    std::string_view line = text.substr(0, eol);
    text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
    ++lineNo;
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      break;
    }
    if (IsOws(line.front())) {
      if (headers.empty()) {
        ThrowMalformed(lineNo, "continuation without a preceding field");
      }
      auto& value = headers.back().value;
      const auto continuation = TrimOws(line);
      if (!continuation.empty()) {
        if (!value.empty()) {
          value.push_back(' ');
        }
        value.append(continuation);
      }
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      ThrowMalformed(lineNo, "missing ':'");
    }
    const std::string_view name = line.substr(0, colon);
    if (name.empty()) {
      ThrowMalformed(lineNo, "empty field name");
    }
    for (char ch : name) {
      if (!IsTokenChar(ch)) {
        ThrowMalformed(lineNo, "invalid character in field name");
      }
    }
    headers.push_back(Header{std::string(name), std::string(TrimOws(line.substr(colon + 1)))});
  }
  return headers;
}

}  // namespace snowweb::http
