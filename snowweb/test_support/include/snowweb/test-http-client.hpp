#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "snowweb/base-fd.hpp"
#include "snowweb/http-header.hpp"
#include "snowweb/request-builder.hpp"
#include "snowweb/tls-raii.hpp"

namespace snowweb::test {

struct ClientResponse {
  int status{0};
  std::string reason;
  http::HeaderList headers;
  std::string body;

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const {
    return http::FindHeader(headers, name);
  }
};

struct HttpClientOptions {
  bool tls{false};
  std::string clientCertPem;  // optional client cert (mTLS)
  std::string clientKeyPem;   // optional client key (mTLS)
};

// Minimal blocking HTTP/1.1 client used by tests, over plain TCP, a Unix socket or TLS.
// Peer verification is disabled (tests use self-signed server certificates).
class HttpClient {
 public:
  using Options = HttpClientOptions;

  // Connects to 127.0.0.1:port.
  explicit HttpClient(uint16_t port, Options options = {});

  // Connects to a Unix socket.
  explicit HttpClient(const std::string& unixPath, Options options = {});

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  ~HttpClient();

  [[nodiscard]] bool connected() const noexcept { return _connected; }

  [[nodiscard]] std::string_view negotiatedAlpn() const noexcept;

  // Subject of the certificate presented by the server (TLS only).
  [[nodiscard]] std::string serverSubject() const;

  // Sends one request on the connection and reads its response (Content-Length framed).
  // Returns std::nullopt if the connection failed or was closed before a complete response.
  std::optional<ClientResponse> request(std::string_view method, std::string_view target, HeaderInit headers = {},
                                        std::string_view body = {});

  std::optional<ClientResponse> get(std::string_view target, HeaderInit headers = {}) {
    return request("GET", target, headers);
  }

  // Sends raw bytes.
  bool sendRaw(std::string_view data);

  // Reads until the peer closes the connection (or the read timeout of 10 seconds expires).
  std::string readUntilClose();

  // Reads one response, as request() does.
  std::optional<ClientResponse> readResponse(bool headRequest = false);

 private:
  void init(int family, const void* addr, unsigned addrLen);

  long readSome(char* buf, std::size_t len);

  Options _options;
  BaseFd _fd;
  SslCtxPtr _ctx{nullptr, ::SSL_CTX_free};
  SslPtr _ssl{nullptr, ::SSL_free};
  std::string _buffer;
  bool _connected{false};
};

}  // namespace snowweb::test
