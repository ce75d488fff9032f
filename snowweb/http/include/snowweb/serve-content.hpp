#pragma once

#include <string_view>

#include "snowweb/file.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"

namespace snowweb {

// Completes 'response', which already carries the representation headers (Content-Type, ETag, Cache-Control...),
// with the content of 'file', honoring the conditional (If-Match, If-None-Match, If-Range) and Range request headers.
// 'etag' is the strong entity tag of the representation, quotes included.
// Only single byte ranges are supported; multi-range requests are answered with 416.
void ServeContent(const HttpRequest& request, File file, std::string_view etag, HttpResponse& response);

}  // namespace snowweb
