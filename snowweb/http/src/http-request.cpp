#include "snowweb/http-request.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include "snowweb/header-lines.hpp"
#include "snowweb/http-constants.hpp"
#include "snowweb/http-method.hpp"
#include "snowweb/http-status-code.hpp"
#include "snowweb/log.hpp"
#include "snowweb/string-equal-ignore-case.hpp"
#include "snowweb/url-decode.hpp"

namespace snowweb {

namespace {

bool ConnectionHasToken(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto comma = value.find(',');
    std::string_view item = value.substr(0, comma);
    while (!item.empty() && item.front() == ' ') {
      item.remove_prefix(1);
    }
    while (!item.empty() && item.back() == ' ') {
      item.remove_suffix(1);
    }
    if (CaseInsensitiveEqual(item, token)) {
      return true;
    }
    if (comma == std::string_view::npos) {
      break;
    }
    value.remove_prefix(comma + 1);
  }
  return false;
}

}  // namespace

bool HttpRequest::wantsKeepAlive() const {
  const auto connection = headerValueOrEmpty(http::Connection);
  if (_version == http::HTTP10Sv) {
    return ConnectionHasToken(connection, http::keepalive);
  }
  return !ConnectionHasToken(connection, http::close);
}

http::StatusCode ParseRequestHead(std::string_view head, HttpRequest& request) {
  const auto eol = head.find("\r\n");
  const std::string_view requestLine = head.substr(0, eol);
  const std::string_view fields = eol == std::string_view::npos ? std::string_view{} : head.substr(eol + 2);

  const auto firstSpace = requestLine.find(' ');
  const auto lastSpace = requestLine.rfind(' ');
  if (firstSpace == std::string_view::npos || firstSpace == lastSpace) {
    return http::StatusCodeBadRequest;
  }
  request._methodStr.assign(requestLine.substr(0, firstSpace));
  request._target.assign(requestLine.substr(firstSpace + 1, lastSpace - firstSpace - 1));
  request._version.assign(requestLine.substr(lastSpace + 1));
  request._method = http::MethodFromString(request._methodStr);

  if (request._methodStr.empty() || request._target.empty() || request._target.contains(' ')) {
    return http::StatusCodeBadRequest;
  }
  if (!request._version.starts_with("HTTP/")) {
    return http::StatusCodeBadRequest;
  }
  if (request._version != http::HTTP11Sv && request._version != http::HTTP10Sv) {
    return http::StatusCodeHTTPVersionNotSupported;
  }

  std::string_view target = request._target;
  if (!target.starts_with('/')) {
    // absolute-form (RFC 9112 §3.2.2): keep the path component only
    const auto scheme = target.find("://");
    if (scheme == std::string_view::npos) {
      return http::StatusCodeBadRequest;
    }
    const auto pathStart = target.find('/', scheme + 3);
    target = pathStart == std::string_view::npos ? std::string_view("/") : target.substr(pathStart);
  }
  request._path.assign(target.substr(0, target.find_first_of("?#")));
  if (!url::DecodePathInPlace(request._path)) {
    return http::StatusCodeBadRequest;
  }

  try {
    request._headers = http::ParseHeaderLines(fields);
  } catch (const std::invalid_argument& ex) {
    log::debug("Rejecting request head: {}", ex.what());
    return http::StatusCodeBadRequest;
  }
  return http::StatusCodeOK;
}

}  // namespace snowweb
