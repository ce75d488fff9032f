#include "snowweb/site-coordinator.hpp"

#include <cerrno>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "snowweb/content-negotiation.hpp"
#include "snowweb/content-server.hpp"
#include "snowweb/error-responder.hpp"
#include "snowweb/error.hpp"
#include "snowweb/file.hpp"
#include "snowweb/header-lines.hpp"
#include "snowweb/http-constants.hpp"
#include "snowweb/http-method.hpp"
#include "snowweb/http-status-code.hpp"
#include "snowweb/json-serializer.hpp"
#include "snowweb/log.hpp"

namespace snowweb {

namespace {

struct StatusBody {
  bool ok{true};
  std::string path;
};

struct FailureBody {
  bool ok{false};
  std::string error;
};

bool PrefersJson(const HttpRequest& request) {
  return http::NegotiateContentType(request.headerValueOrEmpty(http::Accept), {"text/plain", "application/json"}) ==
         "application/json";
}

void SetServingBody(const HttpRequest& request, std::string_view path, HttpResponse& response) {
  if (PrefersJson(request)) {
    response.body(SerializeToJson(StatusBody{true, std::string(path)}), http::ContentTypeApplicationJson);
  } else {
    response.body(std::format("ok\nserving {}\n", path));
  }
}

}  // namespace

SiteCoordinatorConfig& SiteCoordinatorConfig::withReloadFailureStatus(http::StatusCode status) {
  reloadFailureStatus = status;
  return *this;
}

SiteCoordinatorConfig& SiteCoordinatorConfig::withErrorResponder(std::shared_ptr<const ErrorResponder> responder) {
  errorResponder = std::move(responder);
  return *this;
}

void SiteCoordinatorConfig::validate() const {
  if (reloadFailureStatus < 200 || reloadFailureStatus > 599) {
    throw std::invalid_argument("reloadFailureStatus must be a final status code");
  }
  if (!errorResponder) {
    throw std::invalid_argument("errorResponder must not be null");
  }
}

http::HeaderList ReadHeaderOverrides(const std::string& path) {
  std::error_code ec;
  const File file = File::Open(path, ec);
  if (ec) {
    if (ec.value() == ENOENT || ec.value() == ENOTDIR) {
      return {};
    }
    throw std::system_error(ec, "Unable to open header overrides '" + path + "'");
  }
  return http::ParseHeaderLines(file.loadAllContent());
}

SiteCoordinator::SiteCoordinator(std::string installable, std::unique_ptr<SiteBuilder> builder,
                                 SiteCoordinatorConfig config)
    : _builder(std::move(builder)), _config(std::move(config)), _installable(std::move(installable)) {
  _config.validate();
  if (!_builder) {
    throw std::invalid_argument("SiteCoordinator requires a builder");
  }
}

std::shared_ptr<const ServingSnapshot> SiteCoordinator::rebuild() {
  std::lock_guard<std::mutex> lock(_rebuildMutex);
  return rebuildLocked(_installable);
}

std::shared_ptr<const ServingSnapshot> SiteCoordinator::rebuild(std::string_view installable) {
  std::lock_guard<std::mutex> lock(_rebuildMutex);
  std::string newInstallable(installable);
  auto snapshot = rebuildLocked(newInstallable);
  _installable = std::move(newInstallable);
  return snapshot;
}

std::string SiteCoordinator::installable() const {
  std::lock_guard<std::mutex> lock(_rebuildMutex);
  return _installable;
}

std::shared_ptr<const ServingSnapshot> SiteCoordinator::rebuildLocked(const std::string& installable) {
  log::info("Building {} ({} builder)", installable, _builder->name());
  try {
    ContentRoot root = _builder->build(installable);
    const std::string headersPath = root.path + '/' + std::string(SiteCoordinatorConfig::kHeadersFile);
    auto extraHeaders = ReadHeaderOverrides(headersPath);
    log::debug("Read {} site specific header(s) from '{}'", extraHeaders.size(), headersPath);

    auto snapshot = std::make_shared<const ServingSnapshot>(
        ServingSnapshot{installable, ContentServer(std::move(root), _config.errorResponder), std::move(extraHeaders)});
    _snapshot.store(snapshot, std::memory_order_release);
    log::info("Now serving {} (ETag {})", snapshot->contentServer.root().path, snapshot->contentServer.etag());
    return snapshot;
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::Build, "rebuild failed", {{"installable", installable}});
  }
}

HttpResponse SiteCoordinator::operator()(const HttpRequest& request) {
  auto snapshot = this->snapshot();
  if (!snapshot) {
    return HttpResponse(http::StatusCodeServiceUnavailable);
  }
  HttpResponse response = route(request, snapshot);
  for (const auto& header : snapshot->extraHeaders) {
    response.addHeader(header.name, header.value);
  }
  return response;
}

HttpResponse SiteCoordinator::route(const HttpRequest& request, std::shared_ptr<const ServingSnapshot>& snapshot) {
  std::string_view path = request.path();
  if (path == SiteCoordinatorConfig::kStatusPath) {
    return serveStatus(request, *snapshot);
  }
  if (path == SiteCoordinatorConfig::kReloadPath) {
    return serveReload(request, snapshot);
  }
  while (path.starts_with('/')) {
    path.remove_prefix(1);
  }
  constexpr auto kReservedDir = SiteCoordinatorConfig::kReservedDir;
  if (path.starts_with(kReservedDir) && (path.size() == kReservedDir.size() || path[kReservedDir.size()] == '/')) {
    return _config.errorResponder->respond(RequestError::NotFound, request);
  }
  return snapshot->contentServer.serve(request);
}

HttpResponse SiteCoordinator::serveStatus(const HttpRequest& request, const ServingSnapshot& snapshot) const {
  if (request.method() != http::Method::GET && request.method() != http::Method::HEAD) {
    HttpResponse response = _config.errorResponder->respond(RequestError::UnsupportedMethod, request);
    response.addHeader(http::Vary, http::Accept);
    return response;
  }
  HttpResponse response;
  response.addHeader(http::Vary, http::Accept);
  SetServingBody(request, snapshot.contentServer.root().path, response);
  return response;
}

HttpResponse SiteCoordinator::serveReload(const HttpRequest& request,
                                          std::shared_ptr<const ServingSnapshot>& snapshot) {
  HttpResponse response;
  response.addHeader(http::Vary, http::Accept);
  if (request.method() != http::Method::POST) {
    response.status(http::StatusCodeMethodNotAllowed).header(http::Allow, "POST");
    return response;
  }
  if (!request.isTls() || !request.tlsPeer().verified) {
    log::warn("Rejected reload request: {}",
              !request.isTls()                          ? "not over TLS"
              : !request.tlsPeer().certificatePresented ? "no client certificate"
                                                        : "client certificate not verified");
    response.status(http::StatusCodeForbidden);
    return response;
  }

  log::info("Reload requested by '{}'", request.tlsPeer().subject);
  try {
    snapshot = rebuild();
    SetServingBody(request, snapshot->contentServer.root().path, response);
  } catch (const std::exception& ex) {
    const std::string chain = FormatErrorChain(ex);
    log::error("Remote reload failed: {}", chain);
    response.status(_config.reloadFailureStatus);
    if (PrefersJson(request)) {
      response.body(SerializeToJson(FailureBody{false, chain}), http::ContentTypeApplicationJson);
    } else {
      response.body(std::format("error\n{}\n", chain));
    }
  }
  return response;
}

}  // namespace snowweb
