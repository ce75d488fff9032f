#pragma once

#include <string_view>

#include "snowweb/http-header.hpp"

namespace snowweb::http {

// Parses MIME style header lines ("Name: value"), one per line (LF or CRLF), stopping at the first empty line.
// Lines starting with a space or tab continue the value of the previous field.
// Throws std::invalid_argument on malformed input (missing colon, invalid field name, dangling continuation).
[[nodiscard]] HeaderList ParseHeaderLines(std::string_view text);

}  // namespace snowweb::http
