#include "snowweb/content-server.hpp"

#include <cerrno>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "snowweb/content-negotiation.hpp"
#include "snowweb/content-root.hpp"
#include "snowweb/error-responder.hpp"
#include "snowweb/file.hpp"
#include "snowweb/http-constants.hpp"
#include "snowweb/http-method.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"
#include "snowweb/log.hpp"
#include "snowweb/mime-mappings.hpp"
#include "snowweb/serve-content.hpp"

namespace snowweb {

namespace {

constexpr std::string_view kBrotliSuffix = ".br";

bool IsValidRelativePath(std::string_view path) {
  if (path.empty() || path.contains('\0')) {
    return false;
  }
  while (true) {
    const auto slash = path.find('/');
    const std::string_view segment = path.substr(0, slash);
    if (segment.empty() || segment == "." || segment == "..") {
      return false;
    }
    if (slash == std::string_view::npos) {
      return true;
    }
    path.remove_prefix(slash + 1);
  }
}

bool IsMissing(const std::error_code& ec) noexcept { return ec.value() == ENOENT || ec.value() == ENOTDIR; }

}  // namespace

ContentServer::ContentServer(ContentRoot root, std::shared_ptr<const ErrorResponder> errorResponder)
    : _root(std::move(root)), _etag("\"" + _root.hash + "\""), _errorResponder(std::move(errorResponder)) {
  if (!_errorResponder) {
    throw std::invalid_argument("ContentServer requires an error responder");
  }
}

std::optional<std::string> ContentServer::NormalizePath(std::string_view requestPath) {
  while (requestPath.starts_with('/')) {
    requestPath.remove_prefix(1);
  }
  std::string path(requestPath);
  if (path.empty() || path.ends_with('/')) {
    path.append(kIndexFile);
  }
  if (!IsValidRelativePath(path)) {
    return std::nullopt;
  }
  return path;
}

HttpResponse ContentServer::serve(const HttpRequest& request) const {
  if (request.method() != http::Method::GET && request.method() != http::Method::HEAD) {
    return _errorResponder->respond(RequestError::UnsupportedMethod, request);
  }

  auto relativePath = NormalizePath(request.path());
  if (!relativePath) {
    log::debug("Invalid request path '{}'", request.path());
    return _errorResponder->respond(RequestError::InvalidPath, request);
  }
  log::trace("Rewritten request path '{}' to '{}'", request.path(), *relativePath);

  std::string filePath = _root.path + '/' + *relativePath;
  std::error_code ec;
  File file = File::Open(filePath, ec);
  if (!ec && file.isDirectory()) {
    relativePath->append("/").append(kIndexFile);
    filePath.append("/").append(kIndexFile);
    file = File::Open(filePath, ec);
  }
  if (ec) {
    if (IsMissing(ec)) {
      return _errorResponder->respond(RequestError::NotFound, request);
    }
    log::error("Unable to open '{}': {}", filePath, ec.message());
    return _errorResponder->respond(RequestError::Io, request);
  }
  if (!file.isRegular()) {
    log::error("'{}' is not a regular file", filePath);
    return _errorResponder->respond(RequestError::Io, request);
  }

  HttpResponse response;
  response.header(http::CacheControl, kCacheControl);
  response.header(http::ETag, _etag);
  response.header(http::Vary, http::AcceptEncoding);
  response.header(http::ContentType, DetermineMIMEType(*relativePath));
  response.header(http::AcceptRanges, http::bytes);

  if (http::EncodingAccepted(request.headerValueOrEmpty(http::AcceptEncoding), http::br)) {
    const std::string brPath = filePath + std::string(kBrotliSuffix);
    std::error_code brEc;
    File brFile = File::Open(brPath, brEc);
    if (!brEc && brFile.isRegular()) {
      log::trace("Sending precompressed file '{}'", brPath);
      file = std::move(brFile);
      response.header(http::ContentEncoding, http::br);
    } else if (brEc && !IsMissing(brEc)) {
      log::error("Unable to open '{}': {}", brPath, brEc.message());
    }
  }

  ServeContent(request, std::move(file), _etag, response);
  log::debug("Served '{}' with status {}", request.path(), response.status());
  return response;
}

}  // namespace snowweb
