#include "snowweb/tls-material.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "snowweb/file.hpp"
#include "snowweb/openssl-error.hpp"
#include "snowweb/tls-raii.hpp"

namespace snowweb {

TlsMaterial::TlsMaterial(std::string certPem, std::string keyPem)
    : _certPem(std::move(certPem)), _keyPem(std::move(keyPem)), _chain(sk_X509_new_null()) {
  if (!_chain) {
    ThrowOpenSslError("Unable to allocate certificate chain");
  }
  ::ERR_clear_error();

  auto certBio = MakeMemBio(_certPem.data(), static_cast<int>(_certPem.size()));
  _leaf = MakeX509(::PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
  if (!_leaf) {
    ThrowOpenSslError("Unable to parse certificate PEM");
  }
  for (;;) {
    auto intermediate = MakeX509(::PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
    if (!intermediate) {
      // end of input is reported as PEM_R_NO_START_LINE
      const auto err = ::ERR_peek_last_error();
      if (ERR_GET_LIB(err) == ERR_LIB_PEM && ERR_GET_REASON(err) == PEM_R_NO_START_LINE) {
        ::ERR_clear_error();
        break;
      }
      ThrowOpenSslError("Unable to parse intermediate certificate PEM");
    }
    if (sk_X509_push(_chain.get(), intermediate.get()) <= 0) {
      ThrowOpenSslError("Unable to append intermediate certificate");
    }
    intermediate.release();
  }

  auto keyBio = MakeMemBio(_keyPem.data(), static_cast<int>(_keyPem.size()));
  _key = MakePKey(::PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr));
  if (!_key) {
    ThrowOpenSslError("Unable to parse private key PEM");
  }
  if (::X509_check_private_key(_leaf.get(), _key.get()) != 1) {
    ThrowOpenSslError("Private key does not match certificate");
  }
}

TlsMaterial TlsMaterial::FromFiles(const std::string& certPath, const std::string& keyPath) {
  auto certPem = File(certPath).loadAllContent();
  auto keyPem = File(keyPath).loadAllContent();
  return {std::move(certPem), std::move(keyPem)};
}

int TlsMaterial::chainLength() const noexcept { return sk_X509_num(_chain.get()); }

std::string TlsMaterial::subject() const { return X509NameToString(::X509_get_subject_name(_leaf.get())); }

bool TlsMaterial::applyTo(SSL* ssl) const noexcept {
  return ::SSL_use_cert_and_key(ssl, _leaf.get(), _key.get(), _chain.get(), 1) == 1;
}

std::string X509NameToString(const X509_NAME* name) {
  std::string out;
  if (name == nullptr) {
    return out;
  }
  auto bio = MakeMemoryBio();
  if (::X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0) {
    return out;
  }
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio.get(), &data);
  if (len > 0) {
    out.assign(data, static_cast<std::size_t>(len));
  }
  return out;
}

}  // namespace snowweb
