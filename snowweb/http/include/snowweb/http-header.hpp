#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "snowweb/string-equal-ignore-case.hpp"

namespace snowweb::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const = default;
};

// Ordered list of header fields, duplicates allowed.
using HeaderList = std::vector<Header>;

// Returns the value of the first header named 'name' (case-insensitive), if any.
[[nodiscard]] inline std::optional<std::string_view> FindHeader(const HeaderList& headers, std::string_view name) {
  for (const auto& header : headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

}  // namespace snowweb::http
