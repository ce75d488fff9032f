#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <new>

namespace snowweb {

// Owning handles over OpenSSL objects.
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;

// Frees the stack and every certificate in it.
struct X509StackFree {
  void operator()(STACK_OF(X509) * stack) const noexcept { sk_X509_pop_free(stack, ::X509_free); }
};

using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackFree>;

inline BioPtr MakeBio(BIO* bio) {
  if (bio == nullptr) {
    throw std::bad_alloc();
  }
  return {bio, ::BIO_free};
}

// Read only view over 'data', which must outlive the BIO.
inline BioPtr MakeMemBio(const void* data, int len) { return MakeBio(BIO_new_mem_buf(data, len)); }

// Growable memory BIO, for PEM output.
inline BioPtr MakeMemoryBio() { return MakeBio(BIO_new(BIO_s_mem())); }

// Unlike the other helpers, a null pointer is kept as is: PEM readers return null on parse failure.
inline X509Ptr MakeX509(X509* x509) noexcept { return {x509, ::X509_free}; }

inline PKeyPtr MakePKey(EVP_PKEY* pkey) noexcept { return {pkey, ::EVP_PKEY_free}; }

}  // namespace snowweb
