#pragma once

#include <functional>

#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"

namespace snowweb {

// Called concurrently from connection worker threads.
// Exceptions escaping the handler are logged and answered with 500.
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

}  // namespace snowweb
