#pragma once

#include <openssl/ssl.h>

#include <memory>
#include <string_view>

#include "snowweb/tls-material-manager.hpp"
#include "snowweb/tls-raii.hpp"

namespace snowweb {

// Server side SSL_CTX. The certificate is not fixed at construction: each handshake picks the material currently
// published by the TlsMaterialManager, so reloads apply to new connections without touching established ones.
// Properties: TLS >= 1.2, no session tickets, ALPN "http/1.1" only.
class TlsContext {
 public:
  // 'clientCaPem' is an optional PEM bundle of client certificate roots. When given, clients are asked for a
  // certificate, which is verified if presented; connections without one are still accepted.
  // Throws std::runtime_error if the bundle cannot be parsed or contains no certificate.
  explicit TlsContext(std::shared_ptr<TlsMaterialManager> materialManager, std::string_view clientCaPem = {});

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

  [[nodiscard]] bool verifiesClients() const noexcept { return _verifiesClients; }

  [[nodiscard]] const TlsMaterialManager& materialManager() const noexcept { return *_materialManager; }

  // Creates a new server SSL session bound to 'fd'. Throws std::runtime_error on failure.
  [[nodiscard]] SslPtr newSession(int fd) const;

 private:
  static int CertCallback(SSL* ssl, void* arg);

  static int SelectAlpn(SSL* ssl, const unsigned char** out, unsigned char* outlen, const unsigned char* in,
                        unsigned int inlen, void* arg);

  void configureClientVerification(std::string_view clientCaPem);

  std::shared_ptr<TlsMaterialManager> _materialManager;
  SslCtxPtr _ctx;
  bool _verifiesClients{false};
};

}  // namespace snowweb
