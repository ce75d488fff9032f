#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "snowweb/file.hpp"
#include "snowweb/http-constants.hpp"
#include "snowweb/http-header.hpp"
#include "snowweb/http-status-code.hpp"

namespace snowweb {

// HttpResponse is the response model handed back by request handlers.
// The body is either an in-memory string or a window of an opened file (sent with sendfile for plain transports).
// Content-Length, Date and Connection are managed by the server and should not be set by handlers.
class HttpResponse {
 public:
  struct FilePayload {
    File file;
    std::size_t offset{0};
    std::size_t length{0};
  };

  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK) : _status(code) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  HttpResponse& status(http::StatusCode code) & noexcept {
    _status = code;
    return *this;
  }

  // Standard reason phrase of the current status.
  [[nodiscard]] std::string_view reason() const noexcept { return http::ReasonPhrase(_status); }

  // Appends a header, keeping any existing header with the same name.
  HttpResponse& addHeader(std::string_view name, std::string_view value) &;

  // Sets a header, replacing all existing headers with the same name (case-insensitive).
  HttpResponse& header(std::string_view name, std::string_view value) &;

  // Removes all headers named 'name' (case-insensitive).
  HttpResponse& removeHeader(std::string_view name) &;

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const {
    return http::FindHeader(_headers, name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] const http::HeaderList& headers() const noexcept { return _headers; }

  // Sets an inline body and its Content-Type. An empty content type leaves Content-Type untouched.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) &;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Use the whole file as body.
  HttpResponse& file(File file) &;

  // Use bytes [offset, offset + length) of the file as body.
  HttpResponse& file(File file, std::size_t offset, std::size_t length) &;

  [[nodiscard]] const FilePayload* filePayload() const noexcept { return _file ? &*_file : nullptr; }

  // Number of body bytes this response carries (for Content-Length).
  [[nodiscard]] std::size_t bodyLength() const noexcept { return _file ? _file->length : _body.size(); }

  // Serializes status line and header fields, terminated by the empty line.
  // 'extraHeaders' are appended after the response's own headers (server managed fields).
  [[nodiscard]] std::string headString(std::string_view version, const http::HeaderList& extraHeaders) const;

 private:
  http::StatusCode _status;
  http::HeaderList _headers;
  std::string _body;
  std::optional<FilePayload> _file;
};

}  // namespace snowweb
