#include "snowweb/http-response.hpp"

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "snowweb/file.hpp"
#include "snowweb/http-constants.hpp"
#include "snowweb/http-header.hpp"
#include "snowweb/string-equal-ignore-case.hpp"

namespace snowweb {

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) & {
  _headers.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

HttpResponse& HttpResponse::removeHeader(std::string_view name) & {
  std::erase_if(_headers, [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  return *this;
}

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) & {
  removeHeader(name);
  return addHeader(name, value);
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) & {
  _file.reset();
  _body = std::move(body);
  if (!contentType.empty()) {
    header(http::ContentType, contentType);
  }
  return *this;
}

HttpResponse& HttpResponse::file(File file) & {
  const auto size = file.size();
  return this->file(std::move(file), 0, size);
}

HttpResponse& HttpResponse::file(File file, std::size_t offset, std::size_t length) & {
  _body.clear();
  _file.emplace(FilePayload{std::move(file), offset, length});
  return *this;
}

std::string HttpResponse::headString(std::string_view version, const http::HeaderList& extraHeaders) const {
  std::string out = std::format("{} {} {}", version, _status, reason());
  out.append(http::CRLF);
  const auto appendHeader = [&out](const http::Header& header) {
    out.append(header.name);
    out.append(": ");
    out.append(header.value);
    out.append(http::CRLF);
  };
  for (const auto& header : _headers) {
    appendHeader(header);
  }
  for (const auto& header : extraHeaders) {
    appendHeader(header);
  }
  out.append(http::CRLF);
  return out;
}

}  // namespace snowweb
