#include "snowweb/test-tls-helper.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "snowweb/tls-raii.hpp"

namespace snowweb::test {

namespace {

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;

PKeyPtr GenerateP256Key() {
  EVP_PKEY* pkey = nullptr;
  PkeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), ::EVP_PKEY_CTX_free);
  if (kctx == nullptr || ::EVP_PKEY_keygen_init(kctx.get()) != 1 ||
      ::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1) != 1 ||
      ::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    return MakePKey(nullptr);
  }
  return MakePKey(pkey);
}

template <class WriteFunc>
std::string ToPem(WriteFunc&& writeFunc) {
  std::string pem;
  auto bio = MakeMemoryBio();
  if (writeFunc(bio.get()) == 1) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    pem.assign(data, static_cast<std::size_t>(len));
  }
  return pem;
}

}  // namespace

std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName, int validSeconds) {
  auto pkey = GenerateP256Key();
  if (!pkey) {
    return {"", ""};
  }

  auto x509Ptr = MakeX509(::X509_new());
  X509* x509 = x509Ptr.get();
  if (x509 == nullptr) {
    return {"", ""};
  }
  ::X509_set_version(x509, X509_VERSION_3);
  ::ASN1_INTEGER_set(::X509_get_serialNumber(x509), 1);
  ::X509_gmtime_adj(::X509_get_notBefore(x509), 0);
  ::X509_gmtime_adj(::X509_get_notAfter(x509), validSeconds);
  ::X509_set_pubkey(x509, pkey.get());
  X509_NAME* name = ::X509_get_subject_name(x509);
  ::X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("SnowwebTest"), -1, -1,
                               0);
  ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(commonName), -1, -1,
                               0);
  ::X509_set_issuer_name(x509, name);

  // Self-signed and usable both as an end entity and as its own trust anchor.
  X509V3_CTX v3ctx;
  X509V3_set_ctx_nodb(&v3ctx);
  ::X509V3_set_ctx(&v3ctx, x509, x509, nullptr, nullptr, 0);
  for (const auto& [nid, value] : {std::pair{NID_basic_constraints, "critical,CA:TRUE"},
                                   std::pair{NID_key_usage, "critical,digitalSignature,keyCertSign"},
                                   std::pair{NID_ext_key_usage, "serverAuth,clientAuth"}}) {
    X509_EXTENSION* ext = ::X509V3_EXT_conf_nid(nullptr, &v3ctx, nid, value);
    if (ext == nullptr) {
      return {"", ""};
    }
    ::X509_add_ext(x509, ext, -1);
    ::X509_EXTENSION_free(ext);
  }

  if (::X509_sign(x509, pkey.get(), ::EVP_sha256()) <= 0) {
    return {"", ""};
  }

  auto certPem = ToPem([x509](BIO* bio) { return ::PEM_write_bio_X509(bio, x509); });
  auto keyPem = ToPem([&pkey](BIO* bio) {
    return ::PEM_write_bio_PrivateKey(bio, pkey.get(), nullptr, nullptr, 0, nullptr, nullptr);
  });
  return {std::move(certPem), std::move(keyPem)};
}

}  // namespace snowweb::test
