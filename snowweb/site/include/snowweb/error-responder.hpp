#pragma once

#include <cstdint>
#include <string_view>

#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"

namespace snowweb {

enum class RequestError : std::uint8_t {
  UnsupportedMethod,  // not GET or HEAD
  InvalidPath,        // empty, '.' or '..' segment, NUL byte
  NotFound,
  Io,  // any other failure opening the requested file
};

[[nodiscard]] std::string_view RequestErrorName(RequestError error) noexcept;

// Strategy producing the response for request errors of the content server and the reserved endpoints.
class ErrorResponder {
 public:
  virtual ~ErrorResponder() = default;

  [[nodiscard]] virtual HttpResponse respond(RequestError error, const HttpRequest& request) const = 0;
};

// Bodyless 405 (with "Allow: GET, HEAD"), 400, 404 and 500 responses.
class DefaultErrorResponder final : public ErrorResponder {
 public:
  [[nodiscard]] HttpResponse respond(RequestError error, const HttpRequest& request) const override;
};

}  // namespace snowweb
