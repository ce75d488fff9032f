#include "snowweb/tls-material.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>

#include "snowweb/temp-file.hpp"
#include "snowweb/test-tls-helper.hpp"
#include "snowweb/tls-raii.hpp"

namespace snowweb {

TEST(TlsMaterialTest, ParsesMatchingPair) {
  const auto [certPem, keyPem] = test::MakeEphemeralCertKey("snowweb.test");
  ASSERT_FALSE(certPem.empty());
  TlsMaterial material(certPem, keyPem);
  EXPECT_NE(material.leaf(), nullptr);
  EXPECT_NE(material.key(), nullptr);
  EXPECT_EQ(material.chainLength(), 0);
  EXPECT_NE(material.subject().find("CN=snowweb.test"), std::string::npos);
  EXPECT_TRUE(material.sameSource(certPem, keyPem));
  EXPECT_FALSE(material.sameSource(certPem, keyPem + "\n"));
}

TEST(TlsMaterialTest, ParsesIntermediates) {
  const auto [leafPem, keyPem] = test::MakeEphemeralCertKey("leaf");
  const auto [intermediatePem, intermediateKey] = test::MakeEphemeralCertKey("intermediate");
  TlsMaterial material(leafPem + intermediatePem, keyPem);
  EXPECT_EQ(material.chainLength(), 1);
  EXPECT_NE(material.subject().find("CN=leaf"), std::string::npos);
}

TEST(TlsMaterialTest, RejectsMismatchedKey) {
  const auto [certPem, keyPem] = test::MakeEphemeralCertKey("one");
  const auto [otherCert, otherKey] = test::MakeEphemeralCertKey("two");
  EXPECT_THROW(TlsMaterial(certPem, otherKey), std::runtime_error);
}

TEST(TlsMaterialTest, RejectsGarbage) {
  const auto [certPem, keyPem] = test::MakeEphemeralCertKey();
  EXPECT_THROW(TlsMaterial("not a certificate", keyPem), std::runtime_error);
  EXPECT_THROW(TlsMaterial(certPem, "not a key"), std::runtime_error);
  EXPECT_THROW(TlsMaterial(certPem + "-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----\n", keyPem),
               std::runtime_error);
}

TEST(TlsMaterialTest, FromFiles) {
  const auto [certPem, keyPem] = test::MakeEphemeralCertKey();
  test::ScopedTempDir dir;
  const auto certPath = dir.writeFile("cert.pem", certPem);
  const auto keyPath = dir.writeFile("key.pem", keyPem);
  const auto material = TlsMaterial::FromFiles(certPath.string(), keyPath.string());
  EXPECT_EQ(material.certPem(), certPem);
  EXPECT_EQ(material.keyPem(), keyPem);
  EXPECT_THROW((void)TlsMaterial::FromFiles((dir.dirPath() / "missing.pem").string(), keyPath.string()),
               std::system_error);
}

TEST(TlsMaterialTest, AppliesToSession) {
  const auto [certPem, keyPem] = test::MakeEphemeralCertKey();
  TlsMaterial material(certPem, keyPem);
  SslCtxPtr ctx(::SSL_CTX_new(TLS_server_method()), ::SSL_CTX_free);
  ASSERT_TRUE(ctx);
  SslPtr ssl(::SSL_new(ctx.get()), ::SSL_free);
  ASSERT_TRUE(ssl);
  EXPECT_TRUE(material.applyTo(ssl.get()));
  EXPECT_EQ(::SSL_get_certificate(ssl.get()) != nullptr, true);
}

}  // namespace snowweb
