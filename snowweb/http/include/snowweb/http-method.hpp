#pragma once

#include <cstdint>
#include <string_view>

namespace snowweb::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH, Unknown };

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",   "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH", "UNKNOWN"};

// Methods are case-sensitive (RFC 9110 §9.1).
constexpr Method MethodFromString(std::string_view str) noexcept {
  for (uint8_t idx = 0; idx < static_cast<uint8_t>(Method::Unknown); ++idx) {
    if (kMethodStrings[idx] == str) {
      return static_cast<Method>(idx);
    }
  }
  return Method::Unknown;
}

constexpr std::string_view MethodToStr(Method method) noexcept { return kMethodStrings[static_cast<uint8_t>(method)]; }

}  // namespace snowweb::http
