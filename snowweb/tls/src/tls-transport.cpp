#include "snowweb/tls-transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "snowweb/file.hpp"
#include "snowweb/log.hpp"
#include "snowweb/openssl-error.hpp"
#include "snowweb/tls-material.hpp"
#include "snowweb/tls-raii.hpp"

namespace snowweb {

namespace {
constexpr std::size_t kSendFileChunkSize = 16UL * 1024UL;
}  // namespace

bool TlsTransport::handshake() {
  ::ERR_clear_error();
  const int ret = ::SSL_accept(_ssl.get());
  if (ret == 1) {
    _handshakeDone = true;
    return true;
  }
  const int err = ::SSL_get_error(_ssl.get(), ret);
  if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    log::debug("TLS handshake timed out");
  } else {
    log::debug("TLS handshake failed (ssl error {}): {}", err, DrainOpenSslErrors());
  }
  ::ERR_clear_error();
  return false;
}

std::ptrdiff_t TlsTransport::read(std::span<char> buf) {
  std::size_t nbRead = 0;
  if (::SSL_read_ex(_ssl.get(), buf.data(), buf.size(), &nbRead) == 1) [[likely]] {
    return static_cast<std::ptrdiff_t>(nbRead);
  }
  const int err = ::SSL_get_error(_ssl.get(), 0);
  if (err == SSL_ERROR_ZERO_RETURN) {
    return 0;
  }
  if (err == SSL_ERROR_SYSCALL && errno == 0 && ::ERR_peek_error() == 0) {
    // peer closed the socket without close_notify
    return 0;
  }
  ::ERR_clear_error();
  return -1;
}

bool TlsTransport::writeAll(std::string_view data) {
  while (!data.empty()) {
    std::size_t written = 0;
    if (::SSL_write_ex(_ssl.get(), data.data(), data.size(), &written) != 1) {
      log::debug("TLS write failed: {}", DrainOpenSslErrors());
      return false;
    }
    data.remove_prefix(written);
  }
  return true;
}

bool TlsTransport::sendFile(const File& file, std::size_t offset, std::size_t length) {
  std::array<std::byte, kSendFileChunkSize> chunk;
  while (length > 0) {
    const auto toRead = std::min(length, chunk.size());
    const auto nbRead = file.readAt(std::span<std::byte>(chunk.data(), toRead), offset);
    if (nbRead == File::kError || nbRead == 0) {
      log::error("Unable to read file for TLS transfer at offset {}", offset);
      return false;
    }
    if (!writeAll(std::string_view(reinterpret_cast<const char*>(chunk.data()), nbRead))) {
      return false;
    }
    offset += nbRead;
    length -= nbRead;
  }
  return true;
}

void TlsTransport::shutdown() noexcept {
  if (_handshakeDone) {
    ::SSL_shutdown(_ssl.get());
  }
  ::ERR_clear_error();
}

bool TlsTransport::peerCertificatePresented() const noexcept { return ::SSL_get0_peer_certificate(_ssl.get()) != nullptr; }

bool TlsTransport::peerVerified() const noexcept {
  return peerCertificatePresented() && ::SSL_get_verify_result(_ssl.get()) == X509_V_OK;
}

std::string TlsTransport::peerSubject() const {
  const X509* cert = ::SSL_get0_peer_certificate(_ssl.get());
  return cert == nullptr ? std::string{} : X509NameToString(::X509_get_subject_name(cert));
}

std::string_view TlsTransport::negotiatedAlpn() const noexcept {
  const unsigned char* data = nullptr;
  unsigned int len = 0;
  ::SSL_get0_alpn_selected(_ssl.get(), &data, &len);
  return data == nullptr ? std::string_view{} : std::string_view(reinterpret_cast<const char*>(data), len);
}

std::string_view TlsTransport::protocolVersion() const noexcept { return ::SSL_get_version(_ssl.get()); }

}  // namespace snowweb
