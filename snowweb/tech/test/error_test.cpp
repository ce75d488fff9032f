#include "snowweb/error.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>

namespace snowweb {

namespace {

void ThrowBuildFailure() {
  try {
    try {
      throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory), "spawn nix");
    } catch (const std::exception&) {
      ThrowWithCause(ErrorKind::BuildOutput, "running build command", {{"command", "nix build"}});
    }
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::Build, "building site", {{"installable", ".#site"}, {"attempt", "1"}});
  }
}

}  // namespace

TEST(ErrorTest, KindAndContext) {
  Error err(ErrorKind::TlsMaterial, "loading certificate", {{"path", "/etc/cert.pem"}});
  EXPECT_EQ(err.kind(), ErrorKind::TlsMaterial);
  EXPECT_STREQ(err.what(), "loading certificate");
  ASSERT_EQ(err.context().size(), 1U);
  EXPECT_EQ(err.contextValue("path"), "/etc/cert.pem");
  EXPECT_FALSE(err.contextValue("missing").has_value());
}

TEST(ErrorTest, FormatChainWithContextAndCauses) {
  try {
    ThrowBuildFailure();
    FAIL() << "expected exception";
  } catch (const std::exception& ex) {
    const std::string chain = FormatErrorChain(ex);
    EXPECT_EQ(chain.rfind("building site (installable=.#site, attempt=1): running build command (command=nix build): spawn nix", 0), 0U)
        << chain;
    EXPECT_EQ(FindErrorKind(ex), ErrorKind::Build);
  }
}

TEST(ErrorTest, FindErrorKindLooksThroughForeignWrappers) {
  try {
    try {
      throw Error(ErrorKind::Watch, "inotify read failed");
    } catch (const std::exception&) {
      std::throw_with_nested(std::runtime_error("event loop"));
    }
  } catch (const std::exception& ex) {
    EXPECT_EQ(FindErrorKind(ex), ErrorKind::Watch);
    EXPECT_EQ(FormatErrorChain(ex), "event loop: inotify read failed");
  }
}

TEST(ErrorTest, PlainExceptionHasNoKind) {
  std::runtime_error plain("boom");
  EXPECT_FALSE(FindErrorKind(plain).has_value());
  EXPECT_EQ(FormatErrorChain(plain), "boom");
}

TEST(ErrorTest, KindNames) {
  EXPECT_EQ(ErrorKindName(ErrorKind::NoSocketsPassed), "no-sockets-passed");
  EXPECT_EQ(ErrorKindName(ErrorKind::ListenerLookup), "listener-lookup");
}

}  // namespace snowweb
