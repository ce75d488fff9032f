#include "snowweb/tls-context.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/tls1.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "snowweb/log.hpp"
#include "snowweb/openssl-error.hpp"
#include "snowweb/tls-material-manager.hpp"
#include "snowweb/tls-raii.hpp"

namespace snowweb {

namespace {

// ALPN wire format: length prefixed protocol names.
constexpr std::array<unsigned char, 9> kAlpnHttp11 = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};

struct X509NameStackFree {
  void operator()(STACK_OF(X509_NAME) * names) const noexcept { sk_X509_NAME_pop_free(names, ::X509_NAME_free); }
};

using X509NameStackPtr = std::unique_ptr<STACK_OF(X509_NAME), X509NameStackFree>;

}  // namespace

TlsContext::TlsContext(std::shared_ptr<TlsMaterialManager> materialManager, std::string_view clientCaPem)
    : _materialManager(std::move(materialManager)), _ctx(::SSL_CTX_new(TLS_server_method()), ::SSL_CTX_free) {
  if (!_ctx) {
    ThrowOpenSslError("SSL_CTX_new failed");
  }
  if (!_materialManager) {
    throw std::invalid_argument("TlsContext requires a TLS material manager");
  }
  SSL_CTX* ctx = _ctx.get();
  if (::SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION) != 1) {
    ThrowOpenSslError("Failed to set minimum TLS version");
  }
  ::SSL_CTX_set_options(ctx, SSL_OP_NO_TICKET | SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);
  ::SSL_CTX_set_cert_cb(ctx, &TlsContext::CertCallback, _materialManager.get());
  ::SSL_CTX_set_alpn_select_cb(ctx, &TlsContext::SelectAlpn, nullptr);
  if (!clientCaPem.empty()) {
    configureClientVerification(clientCaPem);
  }
  log::debug("TLS context ready (client verification {})", _verifiesClients ? "enabled" : "disabled");
}

void TlsContext::configureClientVerification(std::string_view clientCaPem) {
  SSL_CTX* ctx = _ctx.get();
  X509_STORE* store = ::SSL_CTX_get_cert_store(ctx);
  if (store == nullptr) {
    throw std::runtime_error("No cert store available in SSL_CTX");
  }
  X509NameStackPtr caNames(sk_X509_NAME_new_null());
  if (!caNames) {
    ThrowOpenSslError("Unable to allocate client CA name list");
  }

  ::ERR_clear_error();
  auto bio = MakeMemBio(clientCaPem.data(), static_cast<int>(clientCaPem.size()));
  int nbCerts = 0;
  for (;;) {
    auto cert = MakeX509(::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
      const auto err = ::ERR_peek_last_error();
      if (nbCerts > 0 && ERR_GET_LIB(err) == ERR_LIB_PEM && ERR_GET_REASON(err) == PEM_R_NO_START_LINE) {
        ::ERR_clear_error();
        break;
      }
      ThrowOpenSslError(nbCerts == 0 ? "No certificate found in client CA bundle"
                                     : "Unable to parse client CA bundle");
    }
    if (::X509_STORE_add_cert(store, cert.get()) != 1) {
      ThrowOpenSslError("Failed to add client CA certificate to store");
    }
    X509_NAME* name = ::X509_NAME_dup(::X509_get_subject_name(cert.get()));
    if (name == nullptr || sk_X509_NAME_push(caNames.get(), name) <= 0) {
      ::X509_NAME_free(name);
      ThrowOpenSslError("Unable to record client CA name");
    }
    ++nbCerts;
  }

  ::SSL_CTX_set_client_CA_list(ctx, caNames.release());
  // Ask for a certificate and verify it if given, without requiring one.
  ::SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER | SSL_VERIFY_CLIENT_ONCE, nullptr);
  _verifiesClients = true;
  log::info("Client certificates verified against {} CA certificate(s)", nbCerts);
}

SslPtr TlsContext::newSession(int fd) const {
  SslPtr ssl(::SSL_new(_ctx.get()), ::SSL_free);
  if (!ssl) {
    ThrowOpenSslError("SSL_new failed");
  }
  if (::SSL_set_fd(ssl.get(), fd) != 1) {
    ThrowOpenSslError("SSL_set_fd failed");
  }
  return ssl;
}

int TlsContext::CertCallback(SSL* ssl, void* arg) {
  const auto* manager = static_cast<const TlsMaterialManager*>(arg);
  const auto material = manager->currentCertificate();
  if (!material || !material->applyTo(ssl)) {
    log::error("Unable to install TLS material on session: {}", DrainOpenSslErrors());
    return 0;
  }
  return 1;
}

int TlsContext::SelectAlpn([[maybe_unused]] SSL* ssl, const unsigned char** out, unsigned char* outlen,
                           const unsigned char* in, unsigned int inlen, [[maybe_unused]] void* arg) {
  for (unsigned int clientIndex = 0; clientIndex < inlen;) {
    const unsigned int clen = in[clientIndex];
    const unsigned char* cval = in + clientIndex + 1;
    if (clientIndex + 1 + clen > inlen) {
      break;
    }
    if (clen + 1 == kAlpnHttp11.size() && std::memcmp(cval, kAlpnHttp11.data() + 1, clen) == 0) {
      *out = cval;
      *outlen = static_cast<unsigned char>(clen);
      return SSL_TLSEXT_ERR_OK;
    }
    clientIndex += 1 + clen;
  }
  // Clients not offering http/1.1 still get HTTP/1.1, without ALPN acknowledgement.
  return SSL_TLSEXT_ERR_NOACK;
}

}  // namespace snowweb
