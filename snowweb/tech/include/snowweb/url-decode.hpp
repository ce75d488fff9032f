#pragma once

#include <string>

namespace snowweb::url {

// Decode percent-encoded octets of a URL path in place. '+' is kept literally.
// Returns false (leaving 'str' in an unspecified state) if an escape is truncated or not hexadecimal.
[[nodiscard]] bool DecodePathInPlace(std::string& str);

}  // namespace snowweb::url
