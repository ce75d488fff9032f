#pragma once

#include <openssl/ssl.h>

#include <string>
#include <string_view>

#include "snowweb/tls-raii.hpp"

namespace snowweb {

// A server certificate chain with its private key, parsed from PEM and checked to match.
// Instances are immutable once built and shared between handshakes through std::shared_ptr<const TlsMaterial>.
class TlsMaterial {
 public:
  // Parses 'certPem' (leaf certificate first, then any intermediates) and 'keyPem'.
  // Throws std::runtime_error if either cannot be parsed or if the key does not match the leaf certificate.
  TlsMaterial(std::string certPem, std::string keyPem);

  // Reads both PEM files. Throws std::system_error if a file cannot be read, std::runtime_error as above.
  [[nodiscard]] static TlsMaterial FromFiles(const std::string& certPath, const std::string& keyPath);

  TlsMaterial(TlsMaterial&&) noexcept = default;
  TlsMaterial& operator=(TlsMaterial&&) noexcept = default;

  [[nodiscard]] X509* leaf() const noexcept { return _leaf.get(); }

  [[nodiscard]] EVP_PKEY* key() const noexcept { return _key.get(); }

  // Number of intermediate certificates following the leaf.
  [[nodiscard]] int chainLength() const noexcept;

  [[nodiscard]] std::string_view certPem() const noexcept { return _certPem; }

  [[nodiscard]] std::string_view keyPem() const noexcept { return _keyPem; }

  // Tells whether this material was built from exactly these PEM bytes.
  [[nodiscard]] bool sameSource(std::string_view certPem, std::string_view keyPem) const noexcept {
    return _certPem == certPem && _keyPem == keyPem;
  }

  // One line RFC 2253 subject of the leaf certificate.
  [[nodiscard]] std::string subject() const;

  // Installs certificate, chain and key on 'ssl'. Returns false on OpenSSL failure.
  [[nodiscard]] bool applyTo(SSL* ssl) const noexcept;

 private:
  std::string _certPem;
  std::string _keyPem;
  X509Ptr _leaf{nullptr, ::X509_free};
  X509StackPtr _chain;
  PKeyPtr _key{nullptr, ::EVP_PKEY_free};
};

// RFC 2253 one line form of an X509 name.
[[nodiscard]] std::string X509NameToString(const X509_NAME* name);

}  // namespace snowweb
