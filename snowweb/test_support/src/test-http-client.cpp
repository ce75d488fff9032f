#include "snowweb/test-http-client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "snowweb/header-lines.hpp"
#include "snowweb/http-constants.hpp"
#include "snowweb/log.hpp"
#include "snowweb/tls-material.hpp"
#include "snowweb/tls-raii.hpp"

namespace snowweb::test {

namespace {

constexpr unsigned char kAlpnHttp11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};

void LoadClientCertKey(SSL_CTX* ctx, std::string_view certPem, std::string_view keyPem) {
  auto certBio = MakeMemBio(certPem.data(), static_cast<int>(certPem.size()));
  auto keyBio = MakeMemBio(keyPem.data(), static_cast<int>(keyPem.size()));
  auto cert = MakeX509(::PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
  auto key = MakePKey(::PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr));
  if (!cert || !key || ::SSL_CTX_use_certificate(ctx, cert.get()) != 1 ||
      ::SSL_CTX_use_PrivateKey(ctx, key.get()) != 1) {
    throw std::runtime_error("Unable to load test client certificate");
  }
}

}  // namespace

HttpClient::HttpClient(uint16_t port, Options options) : _options(std::move(options)) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  init(AF_INET, &addr, sizeof(addr));
}

HttpClient::HttpClient(const std::string& unixPath, Options options) : _options(std::move(options)) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (unixPath.size() >= sizeof(addr.sun_path)) {
    throw std::invalid_argument("unix socket path too long");
  }
  std::memcpy(addr.sun_path, unixPath.data(), unixPath.size());
  init(AF_UNIX, &addr, sizeof(addr));
}

HttpClient::~HttpClient() {
  if (_ssl && _connected) {
    ::SSL_shutdown(_ssl.get());
  }
}

void HttpClient::init(int family, const void* addr, unsigned addrLen) {
  _fd = BaseFd(::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!_fd) {
    return;
  }
  timeval timeout{10, 0};
  ::setsockopt(_fd.fd(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
  ::setsockopt(_fd.fd(), SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
  if (::connect(_fd.fd(), static_cast<const sockaddr*>(addr), addrLen) != 0) {
    log::warn("test client connect failed: {}", std::strerror(errno));
    return;
  }
  if (!_options.tls) {
    _connected = true;
    return;
  }
  _ctx.reset(::SSL_CTX_new(TLS_client_method()));
  if (!_ctx) {
    return;
  }
  ::SSL_CTX_set_verify(_ctx.get(), SSL_VERIFY_NONE, nullptr);
  ::SSL_CTX_set_alpn_protos(_ctx.get(), kAlpnHttp11, sizeof(kAlpnHttp11));
  if (!_options.clientCertPem.empty()) {
    LoadClientCertKey(_ctx.get(), _options.clientCertPem, _options.clientKeyPem);
  }
  _ssl.reset(::SSL_new(_ctx.get()));
  if (!_ssl || ::SSL_set_fd(_ssl.get(), _fd.fd()) != 1) {
    return;
  }
  _connected = ::SSL_connect(_ssl.get()) == 1;
}

std::string_view HttpClient::negotiatedAlpn() const noexcept {
  if (!_ssl) {
    return {};
  }
  const unsigned char* data = nullptr;
  unsigned int len = 0;
  ::SSL_get0_alpn_selected(_ssl.get(), &data, &len);
  return data == nullptr ? std::string_view{} : std::string_view(reinterpret_cast<const char*>(data), len);
}

std::string HttpClient::serverSubject() const {
  if (!_ssl) {
    return {};
  }
  const X509* cert = ::SSL_get0_peer_certificate(_ssl.get());
  return cert == nullptr ? std::string{} : X509NameToString(::X509_get_subject_name(cert));
}

bool HttpClient::sendRaw(std::string_view data) {
  if (!_connected) {
    return false;
  }
  while (!data.empty()) {
    long written;
    if (_ssl) {
      std::size_t nb = 0;
      written = ::SSL_write_ex(_ssl.get(), data.data(), data.size(), &nb) == 1 ? static_cast<long>(nb) : -1;
    } else {
      written = ::send(_fd.fd(), data.data(), data.size(), MSG_NOSIGNAL);
    }
    if (written <= 0) {
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(written));
  }
  return true;
}

long HttpClient::readSome(char* buf, std::size_t len) {
  if (_ssl) {
    std::size_t nb = 0;
    return ::SSL_read_ex(_ssl.get(), buf, len, &nb) == 1 ? static_cast<long>(nb) : 0;
  }
  return ::recv(_fd.fd(), buf, len, 0);
}

std::string HttpClient::readUntilClose() {
  std::string out = std::move(_buffer);
  _buffer.clear();
  if (!_connected) {
    return out;
  }
  char buf[4096];
  for (long nb = readSome(buf, sizeof(buf)); nb > 0; nb = readSome(buf, sizeof(buf))) {
    out.append(buf, static_cast<std::size_t>(nb));
  }
  return out;
}

std::optional<ClientResponse> HttpClient::readResponse(bool headRequest) {
  char buf[4096];
  std::size_t headEnd;
  while ((headEnd = _buffer.find(http::DoubleCRLF)) == std::string::npos) {
    const long nb = readSome(buf, sizeof(buf));
    if (nb <= 0) {
      return std::nullopt;
    }
    _buffer.append(buf, static_cast<std::size_t>(nb));
  }
  ClientResponse response;
  const std::string_view head(_buffer.data(), headEnd);
  const auto statusLineEnd = head.find(http::CRLF);
  const std::string_view statusLine = head.substr(0, statusLineEnd);
  // HTTP/1.1 200 OK
  if (statusLine.size() < 12) {
    return std::nullopt;
  }
  std::from_chars(statusLine.data() + 9, statusLine.data() + 12, response.status);
  response.reason = statusLine.size() > 13 ? std::string(statusLine.substr(13)) : std::string{};
  if (statusLineEnd != std::string_view::npos) {
    response.headers = http::ParseHeaderLines(head.substr(statusLineEnd + 2));
  }
  _buffer.erase(0, headEnd + http::DoubleCRLF.size());

  std::size_t contentLength = 0;
  if (auto value = response.headerValue(http::ContentLength); value && !headRequest) {
    std::from_chars(value->data(), value->data() + value->size(), contentLength);
  }
  while (_buffer.size() < contentLength) {
    const long nb = readSome(buf, sizeof(buf));
    if (nb <= 0) {
      return std::nullopt;
    }
    _buffer.append(buf, static_cast<std::size_t>(nb));
  }
  response.body = _buffer.substr(0, contentLength);
  _buffer.erase(0, contentLength);
  return response;
}

std::optional<ClientResponse> HttpClient::request(std::string_view method, std::string_view target,
                                                  HeaderInit headers, std::string_view body) {
  std::string raw;
  raw.append(method).append(" ").append(target).append(" HTTP/1.1\r\nHost: localhost\r\n");
  for (const auto& [name, value] : headers) {
    raw.append(name).append(": ").append(value).append(http::CRLF);
  }
  if (!body.empty() || method == "POST") {
    raw.append(http::ContentLength).append(": ").append(std::to_string(body.size())).append(http::CRLF);
  }
  raw.append(http::CRLF).append(body);
  if (!sendRaw(raw)) {
    return std::nullopt;
  }
  return readResponse(method == "HEAD");
}

}  // namespace snowweb::test
