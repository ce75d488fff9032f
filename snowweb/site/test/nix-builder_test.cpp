#include "snowweb/nix-builder.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "snowweb/error.hpp"
#include "snowweb/fake-nix.hpp"
#include "snowweb/file.hpp"
#include "snowweb/scoped-env-var.hpp"
#include "snowweb/temp-file.hpp"

namespace snowweb {

TEST(NixBuilderTest, BuildCommand) {
  const NixBuilder builder;
  const std::vector<std::string> expected{"nix",   "--refresh",  "--experimental-features", "nix-command flakes",
                                          "build", "github:o/r", "--json",                  "--no-link"};
  EXPECT_EQ(builder.buildCommand("github:o/r"), expected);
}

TEST(NixBuilderTest, BuildCommandWithProfile) {
  const NixBuilder builder(NixBuilderConfig{}.withCommand("/opt/nix").withProfile("/var/lib/site/profile"));
  const auto argv = builder.buildCommand(".#site");
  ASSERT_EQ(argv.size(), 10U);
  EXPECT_EQ(argv.front(), "/opt/nix");
  EXPECT_EQ(argv[8], "--profile");
  EXPECT_EQ(argv[9], "/var/lib/site/profile");
}

TEST(NixBuilderTest, PathInfoCommand) {
  const NixBuilder builder;
  const std::vector<std::string> expected{"nix",       "--refresh", "--experimental-features", "nix-command flakes",
                                          "path-info", "--json",    "/nix/store/abc-site"};
  EXPECT_EQ(builder.pathInfoCommand("/nix/store/abc-site"), expected);
}

TEST(NixBuilderTest, ParseBuildOutput) {
  EXPECT_EQ(ParseBuildOutput(R"([{"drvPath":"/nix/store/x.drv","outputs":{"out":"/nix/store/abc-site"}}])"),
            "/nix/store/abc-site");
  EXPECT_EQ(ParseBuildOutput("[{\"outputs\":{\"out\":\"/nix/store/a\",\"doc\":\"/nix/store/b\"}},{}]\n"),
            "/nix/store/a");
}

TEST(NixBuilderTest, ParseBuildOutputErrors) {
  for (const std::string json : {"", "not json", "[]", "{}", R"([{"outputs":{"doc":"/nix/store/b"}}])"}) {
    try {
      (void)ParseBuildOutput(json);
      ADD_FAILURE() << "expected failure for " << json;
    } catch (const Error& ex) {
      EXPECT_EQ(ex.kind(), ErrorKind::BuildOutput) << json;
    }
  }
}

TEST(NixBuilderTest, ParseNarHashListFormat) {
  EXPECT_EQ(ParseNarHash(R"([{"path":"/nix/store/a","narHash":"sha256-AAA=","narSize":12}])", "/nix/store/a"),
            "sha256-AAA=");
}

TEST(NixBuilderTest, ParseNarHashObjectFormat) {
  const std::string json = R"({"/nix/store/a":{"deriver":null,"narHash":"sha256-BBB=","references":[]}})";
  EXPECT_EQ(ParseNarHash(json, "/nix/store/a"), "sha256-BBB=");
  EXPECT_THROW((void)ParseNarHash(json, "/nix/store/other"), Error);
}

TEST(NixBuilderTest, ParseNarHashErrors) {
  for (const std::string json : {"", "[]", R"([{"path":"/nix/store/a"}])", "garbage"}) {
    try {
      (void)ParseNarHash(json, "/nix/store/a");
      ADD_FAILURE() << "expected failure for " << json;
    } catch (const Error& ex) {
      EXPECT_EQ(ex.kind(), ErrorKind::BuildOutput) << json;
    }
  }
}

class NixBuilderProcessTest : public ::testing::Test {
 protected:
  NixBuilderProcessTest() : nix(test::WriteFakeNix(tmpDir.dirPath()).string()) {
    tmpDir.writeFile("site/index.html", "hi");
    tmpDir.writeFile("site/.nar-hash", "sha256-SITE=");
  }

  [[nodiscard]] std::string sitePath() const { return (tmpDir.dirPath() / "site").string(); }

  [[nodiscard]] std::string invocations() const {
    return File((tmpDir.dirPath() / "invocations").string()).loadAllContent();
  }

  test::ScopedTempDir tmpDir;
  std::string nix;
};

TEST_F(NixBuilderProcessTest, BuildsAndQueriesNarHash) {
  NixBuilder builder(NixBuilderConfig{}.withCommand(nix));
  const auto root = builder.build(sitePath());
  EXPECT_EQ(root.path, sitePath());
  EXPECT_EQ(root.hash, "sha256-SITE=");
  const auto calls = invocations();
  EXPECT_TRUE(calls.contains("build " + sitePath() + " --json --no-link"));
  EXPECT_TRUE(calls.contains("path-info --json " + sitePath()));
}

TEST_F(NixBuilderProcessTest, NewerPathInfoFormat) {
  test::ScopedEnvVar format("FAKE_NIX_PATH_INFO_FORMAT", "object");
  NixBuilder builder(NixBuilderConfig{}.withCommand(nix));
  EXPECT_EQ(builder.build(sitePath()).hash, "sha256-SITE=");
}

TEST_F(NixBuilderProcessTest, ProfileIsUpdated) {
  const auto profile = tmpDir.dirPath() / "profile";
  NixBuilder builder(NixBuilderConfig{}.withCommand(nix).withProfile(profile.string()));
  (void)builder.build(sitePath());
  EXPECT_EQ(std::filesystem::read_symlink(profile), sitePath());
}

TEST_F(NixBuilderProcessTest, FailingBuild) {
  test::ScopedEnvVar fail("FAKE_NIX_FAIL", "1");
  NixBuilder builder(NixBuilderConfig{}.withCommand(nix));
  try {
    (void)builder.build(sitePath());
    FAIL() << "expected a build error";
  } catch (const Error& ex) {
    EXPECT_EQ(ex.kind(), ErrorKind::Build);
    EXPECT_EQ(ex.contextValue("status"), "1");
    EXPECT_TRUE(ex.contextValue("command")->contains(" build "));
  }
}

TEST_F(NixBuilderProcessTest, MalformedOutput) {
  test::ScopedEnvVar garbage("FAKE_NIX_GARBAGE", "1");
  NixBuilder builder(NixBuilderConfig{}.withCommand(nix));
  try {
    (void)builder.build(sitePath());
    FAIL() << "expected an output error";
  } catch (const Error& ex) {
    EXPECT_EQ(ex.kind(), ErrorKind::BuildOutput);
  }
}

TEST_F(NixBuilderProcessTest, MissingExecutable) {
  NixBuilder builder(NixBuilderConfig{}.withCommand((tmpDir.dirPath() / "no-such-nix").string()));
  try {
    (void)builder.build(sitePath());
    FAIL() << "expected a build error";
  } catch (const Error& ex) {
    EXPECT_EQ(ex.kind(), ErrorKind::Build);
  }
}

}  // namespace snowweb
