#include <gtest/gtest.h>

#include <string>

#include "snowweb/mime-mappings.hpp"
#include "snowweb/string-equal-ignore-case.hpp"
#include "snowweb/string-trim.hpp"
#include "snowweb/url-decode.hpp"

namespace snowweb {

TEST(StringEqualIgnoreCase, Basic) {
  EXPECT_TRUE(CaseInsensitiveEqual("Accept-Encoding", "accept-encoding"));
  EXPECT_FALSE(CaseInsensitiveEqual("Accept", "Accept-Encoding"));
  EXPECT_TRUE(StartsWithCaseInsensitive("BYTES=0-1", "bytes="));
  EXPECT_FALSE(StartsWithCaseInsensitive("by", "bytes="));
}

TEST(StringTrim, TrimOws) {
  EXPECT_EQ(TrimOws(" \tgzip, br \t"), "gzip, br");
  EXPECT_EQ(TrimOws("   "), "");
  EXPECT_EQ(TrimOws(""), "");
}

TEST(UrlDecode, PathEscapes) {
  std::string path = "/dir%20name/caf%C3%A9.html";
  ASSERT_TRUE(url::DecodePathInPlace(path));
  EXPECT_EQ(path, "/dir name/caf\xC3\xA9.html");

  std::string plus = "/a+b";
  ASSERT_TRUE(url::DecodePathInPlace(plus));
  EXPECT_EQ(plus, "/a+b");

  std::string dotdot = "/%2e%2e/etc/passwd";
  ASSERT_TRUE(url::DecodePathInPlace(dotdot));
  EXPECT_EQ(dotdot, "/../etc/passwd");
}

TEST(UrlDecode, InvalidEscapes) {
  std::string truncated = "/abc%2";
  EXPECT_FALSE(url::DecodePathInPlace(truncated));
  std::string notHex = "/abc%zz";
  EXPECT_FALSE(url::DecodePathInPlace(notHex));
}

TEST(MIMEMappings, Lookup) {
  EXPECT_EQ(DetermineMIMEType("index.html"), "text/html; charset=utf-8");
  EXPECT_EQ(DetermineMIMEType("assets/app.min.js"), "text/javascript; charset=utf-8");
  EXPECT_EQ(DetermineMIMEType("fonts/a.woff2"), "font/woff2");
  EXPECT_EQ(DetermineMIMEType("README"), kDefaultMIMEType);
  EXPECT_EQ(DetermineMIMEType("dir.d/README"), kDefaultMIMEType);
  EXPECT_EQ(DetermineMIMEType("archive.unknownext"), kDefaultMIMEType);
}

}  // namespace snowweb
