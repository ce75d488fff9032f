#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "snowweb/error-responder.hpp"
#include "snowweb/http-header.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"
#include "snowweb/http-status-code.hpp"
#include "snowweb/serving-snapshot.hpp"
#include "snowweb/site-builder.hpp"

namespace snowweb {

struct SiteCoordinatorConfig {
  // Directory of the tree hidden from clients, except for the endpoints below.
  static constexpr std::string_view kReservedDir = ".snowweb";
  static constexpr std::string_view kStatusPath = "/.snowweb/status";
  static constexpr std::string_view kReloadPath = "/.snowweb/reload";
  static constexpr std::string_view kHeadersFile = ".snowweb/headers";

  // Status of the reload endpoint response when the rebuild fails (the body always tells the outcome).
  http::StatusCode reloadFailureStatus{http::StatusCodeOK};

  // Responder for request errors. Defaults to DefaultErrorResponder.
  std::shared_ptr<const ErrorResponder> errorResponder{std::make_shared<DefaultErrorResponder>()};

  SiteCoordinatorConfig& withReloadFailureStatus(http::StatusCode status);

  SiteCoordinatorConfig& withErrorResponder(std::shared_ptr<const ErrorResponder> responder);

  // Throws std::invalid_argument on invalid values.
  void validate() const;
};

// Owns the active ServingSnapshot and routes requests to it.
//
// rebuild() calls are serialized: build, header overrides reading and publication of one rebuild never interleave
// with those of another. Publication is a single atomic store, requests never take the rebuild mutex.
class SiteCoordinator {
 public:
  // Does not build: call rebuild() once before serving.
  SiteCoordinator(std::string installable, std::unique_ptr<SiteBuilder> builder, SiteCoordinatorConfig config = {});

  SiteCoordinator(const SiteCoordinator&) = delete;
  SiteCoordinator& operator=(const SiteCoordinator&) = delete;

  // Rebuilds the current installable and publishes the result.
  // Throws Error{Build} (with the cause nested) on failure, leaving the active snapshot untouched.
  std::shared_ptr<const ServingSnapshot> rebuild();

  // Same, with a new installable which becomes the current one on success.
  std::shared_ptr<const ServingSnapshot> rebuild(std::string_view installable);

  // Active snapshot, nullptr before the first successful rebuild.
  [[nodiscard]] std::shared_ptr<const ServingSnapshot> snapshot() const noexcept {
    return _snapshot.load(std::memory_order_acquire);
  }

  [[nodiscard]] std::string installable() const;

  [[nodiscard]] const SiteBuilder& builder() const noexcept { return *_builder; }

  [[nodiscard]] const SiteCoordinatorConfig& config() const noexcept { return _config; }

  // Request handler entry point, safe to call concurrently.
  HttpResponse operator()(const HttpRequest& request);

 private:
  std::shared_ptr<const ServingSnapshot> rebuildLocked(const std::string& installable);

  // 'snapshot' is replaced by the published one when the request rebuilds the site.
  HttpResponse route(const HttpRequest& request, std::shared_ptr<const ServingSnapshot>& snapshot);

  HttpResponse serveStatus(const HttpRequest& request, const ServingSnapshot& snapshot) const;

  HttpResponse serveReload(const HttpRequest& request, std::shared_ptr<const ServingSnapshot>& snapshot);

  std::unique_ptr<SiteBuilder> _builder;
  SiteCoordinatorConfig _config;

  mutable std::mutex _rebuildMutex;
  std::string _installable;

  std::atomic<std::shared_ptr<const ServingSnapshot>> _snapshot;
};

// Reads the MIME style header override file of a tree. A missing file yields an empty list.
// Throws std::system_error if the file cannot be read, std::invalid_argument if it is malformed.
[[nodiscard]] http::HeaderList ReadHeaderOverrides(const std::string& path);

}  // namespace snowweb
