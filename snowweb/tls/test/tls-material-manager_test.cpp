#include "snowweb/tls-material-manager.hpp"

#include <gtest/gtest.h>
#include <openssl/x509.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "snowweb/certificate-authority.hpp"
#include "snowweb/error.hpp"
#include "snowweb/temp-file.hpp"
#include "snowweb/test-tls-helper.hpp"
#include "snowweb/tls-material.hpp"

namespace snowweb {

class TlsMaterialManagerTest : public ::testing::Test {
 protected:
  void writePair(const std::pair<std::string, std::string>& pair) {
    tmpDir.writeFile("cert.pem", pair.first);
    tmpDir.writeFile("key.pem", pair.second);
  }

  std::unique_ptr<TlsMaterialSource> fileSource() const {
    return std::make_unique<FileMaterialSource>((tmpDir.dirPath() / "cert.pem").string(),
                                                (tmpDir.dirPath() / "key.pem").string());
  }

  test::ScopedTempDir tmpDir;
};

TEST_F(TlsMaterialManagerTest, InitialLoadFailureThrows) {
  try {
    TlsMaterialManager manager(fileSource());
    FAIL() << "expected exception";
  } catch (const Error& err) {
    EXPECT_EQ(err.kind(), ErrorKind::TlsMaterial);
    EXPECT_TRUE(err.contextValue("source").has_value());
  }
}

TEST_F(TlsMaterialManagerTest, ReloadPublishesNewMaterial) {
  writePair(test::MakeEphemeralCertKey("first"));
  TlsMaterialManager manager(fileSource());
  const auto first = manager.currentCertificate();
  ASSERT_TRUE(first);
  EXPECT_NE(first->subject().find("CN=first"), std::string::npos);

  writePair(test::MakeEphemeralCertKey("second"));
  EXPECT_TRUE(manager.reload());
  const auto second = manager.currentCertificate();
  EXPECT_NE(second.get(), first.get());
  EXPECT_NE(second->subject().find("CN=second"), std::string::npos);
  // holders of the previous material keep a valid object
  EXPECT_NE(first->subject().find("CN=first"), std::string::npos);
}

TEST_F(TlsMaterialManagerTest, ReloadOfIdenticalFilesKeepsObject) {
  writePair(test::MakeEphemeralCertKey());
  TlsMaterialManager manager(fileSource());
  const auto before = manager.currentCertificate();
  EXPECT_FALSE(manager.reload());
  EXPECT_FALSE(manager.reload());
  EXPECT_EQ(manager.currentCertificate().get(), before.get());
}

TEST_F(TlsMaterialManagerTest, FailedReloadKeepsPreviousMaterial) {
  writePair(test::MakeEphemeralCertKey("kept"));
  TlsMaterialManager manager(fileSource());
  const auto before = manager.currentCertificate();

  // certificate replaced but key not yet: mismatched pair
  tmpDir.writeFile("cert.pem", test::MakeEphemeralCertKey("half-written").first);
  EXPECT_THROW(manager.reload(), Error);
  EXPECT_EQ(manager.currentCertificate().get(), before.get());

  tmpDir.writeFile("cert.pem", "garbage");
  EXPECT_THROW(manager.reload(), Error);
  EXPECT_EQ(manager.currentCertificate().get(), before.get());
}

TEST_F(TlsMaterialManagerTest, ReadersAlwaysSeeMatchingPairDuringReloads) {
  const auto alpha = test::MakeEphemeralCertKey("alpha");
  const auto beta = test::MakeEphemeralCertKey("beta");
  writePair(alpha);
  TlsMaterialManager manager(fileSource());

  constexpr int kReaders = 4;
  constexpr int kReloaders = 2;
  constexpr int kRewrites = 200;

  std::atomic<bool> done{false};
  std::atomic<int> mismatches{0};
  std::atomic<int> unknownSubjects{0};
  std::atomic<int> reads{0};
  std::atomic<int> failedReloads{0};

  std::vector<std::jthread> threads;
  for (int idx = 0; idx < kReaders; ++idx) {
    threads.emplace_back([&] {
      while (!done.load(std::memory_order_acquire)) {
        const auto material = manager.currentCertificate();
        if (X509_check_private_key(material->leaf(), material->key()) != 1) {
          ++mismatches;
        }
        const auto subject = material->subject();
        if (!subject.contains("CN=alpha") && !subject.contains("CN=beta")) {
          ++unknownSubjects;
        }
        ++reads;
      }
    });
  }
  for (int idx = 0; idx < kReloaders; ++idx) {
    threads.emplace_back([&] {
      while (!done.load(std::memory_order_acquire)) {
        try {
          manager.reload();
        } catch (const Error&) {
          // a half rewritten pair is rejected, the previous material stays active
          ++failedReloads;
        }
      }
    });
  }

  for (int rewrite = 0; rewrite < kRewrites; ++rewrite) {
    writePair(rewrite % 2 == 0 ? beta : alpha);
    std::this_thread::sleep_for(std::chrono::microseconds(200));
  }
  done.store(true, std::memory_order_release);
  threads.clear();

  EXPECT_EQ(mismatches.load(), 0);
  EXPECT_EQ(unknownSubjects.load(), 0);
  EXPECT_GT(reads.load(), 0);

  writePair(beta);
  manager.reload();
  const auto last = manager.currentCertificate();
  EXPECT_TRUE(last->subject().contains("CN=beta"));
  EXPECT_EQ(X509_check_private_key(last->leaf(), last->key()), 1);
}

TEST_F(TlsMaterialManagerTest, FileSourceWatchesBothFiles) {
  const auto source = fileSource();
  const auto files = source->watchedFiles();
  ASSERT_EQ(files.size(), 2U);
  EXPECT_EQ(files[0], (tmpDir.dirPath() / "cert.pem").string());
  EXPECT_EQ(files[1], (tmpDir.dirPath() / "key.pem").string());
}

namespace {

class FakeAuthority final : public CertificateAuthority {
 public:
  explicit FakeAuthority(CertificateFiles files) : _files(std::move(files)) {}

  CertificateFiles obtainOrRenew() override {
    ++calls;
    if (fail) {
      throw Error(ErrorKind::CertificateAuthority, "authority unavailable");
    }
    return _files;
  }

  [[nodiscard]] std::string describe() const override { return "fake authority"; }

  int calls{0};
  bool fail{false};

 private:
  CertificateFiles _files;
};

}  // namespace

TEST_F(TlsMaterialManagerTest, AuthoritySourceAsksAuthorityOnEachLoad) {
  writePair(test::MakeEphemeralCertKey("acme"));
  auto authority = std::make_unique<FakeAuthority>(CertificateFiles{(tmpDir.dirPath() / "cert.pem").string(),
                                                                    (tmpDir.dirPath() / "key.pem").string()});
  auto* authorityPtr = authority.get();
  TlsMaterialManager manager(std::make_unique<AuthorityMaterialSource>(std::move(authority)));
  EXPECT_EQ(authorityPtr->calls, 1);
  EXPECT_TRUE(manager.source().watchedFiles().empty());

  EXPECT_FALSE(manager.reload());
  EXPECT_EQ(authorityPtr->calls, 2);

  authorityPtr->fail = true;
  const auto before = manager.currentCertificate();
  try {
    manager.reload();
    FAIL() << "expected exception";
  } catch (const Error& err) {
    EXPECT_EQ(err.kind(), ErrorKind::TlsMaterial);
    EXPECT_NE(FormatErrorChain(err).find("authority unavailable"), std::string::npos);
  }
  EXPECT_EQ(manager.currentCertificate().get(), before.get());
}

}  // namespace snowweb
