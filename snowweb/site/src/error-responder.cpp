#include "snowweb/error-responder.hpp"

#include <string_view>

#include "snowweb/http-constants.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"
#include "snowweb/http-status-code.hpp"

namespace snowweb {

std::string_view RequestErrorName(RequestError error) noexcept {
  switch (error) {
    case RequestError::UnsupportedMethod:
      return "unsupported-method";
    case RequestError::InvalidPath:
      return "invalid-path";
    case RequestError::NotFound:
      return "not-found";
    case RequestError::Io:
      return "io";
  }
  return "unknown";
}

HttpResponse DefaultErrorResponder::respond(RequestError error, [[maybe_unused]] const HttpRequest& request) const {
  switch (error) {
    case RequestError::UnsupportedMethod: {
      HttpResponse response(http::StatusCodeMethodNotAllowed);
      response.header(http::Allow, "GET, HEAD");
      return response;
    }
    case RequestError::InvalidPath:
      return HttpResponse(http::StatusCodeBadRequest);
    case RequestError::NotFound:
      return HttpResponse(http::StatusCodeNotFound);
    case RequestError::Io:
      break;
  }
  return HttpResponse(http::StatusCodeInternalServerError);
}

}  // namespace snowweb
