#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "snowweb/file.hpp"
#include "snowweb/tls-raii.hpp"
#include "snowweb/transport.hpp"

namespace snowweb {

// Blocking TLS stream over an accepted socket. Timeouts come from the socket (SO_RCVTIMEO / SO_SNDTIMEO).
class TlsTransport final : public ITransport {
 public:
  explicit TlsTransport(SslPtr ssl) noexcept : _ssl(std::move(ssl)) {}

  // Runs the server side handshake. Returns false on failure or timeout.
  [[nodiscard]] bool handshake();

  std::ptrdiff_t read(std::span<char> buf) override;

  bool writeAll(std::string_view data) override;

  // pread() into a bounce buffer, then SSL_write.
  bool sendFile(const File& file, std::size_t offset, std::size_t length) override;

  // Sends close_notify, without waiting for the peer's one.
  void shutdown() noexcept override;

  [[nodiscard]] bool peerCertificatePresented() const noexcept;

  // A client certificate was presented and its chain verified against the configured client roots.
  [[nodiscard]] bool peerVerified() const noexcept;

  // RFC 2253 subject of the client certificate, empty if none.
  [[nodiscard]] std::string peerSubject() const;

  [[nodiscard]] std::string_view negotiatedAlpn() const noexcept;

  [[nodiscard]] std::string_view protocolVersion() const noexcept;

 private:
  SslPtr _ssl;
  bool _handshakeDone{false};
};

}  // namespace snowweb
