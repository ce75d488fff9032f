#include "snowweb/http-status-code.hpp"

#include <string_view>

namespace snowweb::http {

std::string_view ReasonPhrase(StatusCode code) noexcept {
  switch (code) {
    case StatusCodeOK:
      return "OK";
    case StatusCodePartialContent:
      return "Partial Content";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeLengthRequired:
      return "Length Required";
    case StatusCodePreconditionFailed:
      return "Precondition Failed";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeRangeNotSatisfiable:
      return "Range Not Satisfiable";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return {};
  }
}

}  // namespace snowweb::http
