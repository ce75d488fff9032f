#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "snowweb/http-header.hpp"
#include "snowweb/http-method.hpp"
#include "snowweb/http-status-code.hpp"

namespace snowweb {

// Client certificate information of the connection a request arrived on.
struct TlsPeerInfo {
  bool certificatePresented{false};
  // Chain successfully validated against the configured client trust roots.
  bool verified{false};
  // RFC 2253 subject of the client certificate, if presented.
  std::string subject;
};

class HttpRequest {
 public:
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view methodStr() const noexcept { return _methodStr; }

  // Percent-decoded path, without the query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw request target as received.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] const http::HeaderList& headers() const noexcept { return _headers; }

  // Returns the value of the first header named 'key' (case-insensitive), if present.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const {
    return http::FindHeader(_headers, key);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  void body(std::string body) { _body = std::move(body); }

  // True if the request was received over TLS.
  [[nodiscard]] bool isTls() const noexcept { return _isTls; }

  [[nodiscard]] const TlsPeerInfo& tlsPeer() const noexcept { return _tlsPeer; }

  void tlsPeer(TlsPeerInfo peer) {
    _isTls = true;
    _tlsPeer = std::move(peer);
  }

  // Whether the client wants the connection kept open after the response (HTTP/1.1 default, Connection header).
  [[nodiscard]] bool wantsKeepAlive() const;

 private:
  friend http::StatusCode ParseRequestHead(std::string_view head, HttpRequest& request);

  http::Method _method{http::Method::Unknown};
  std::string _methodStr;
  std::string _target;
  std::string _path;
  std::string _version;
  http::HeaderList _headers;
  std::string _body;
  TlsPeerInfo _tlsPeer;
  bool _isTls{false};
};

// Parses a request head (request line followed by header fields, up to but excluding the empty line).
// Returns StatusCodeOK on success, otherwise the error status to reply with (400, 505).
[[nodiscard]] http::StatusCode ParseRequestHead(std::string_view head, HttpRequest& request);

}  // namespace snowweb
