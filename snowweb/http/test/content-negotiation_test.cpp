#include "snowweb/content-negotiation.hpp"

#include <gtest/gtest.h>

namespace snowweb::http {

TEST(NegotiateContentTypeTest, EmptyAcceptSelectsFirstOffer) {
  EXPECT_EQ(NegotiateContentType("", {"text/plain", "application/json"}), "text/plain");
}

TEST(NegotiateContentTypeTest, ExactMatchWins) {
  EXPECT_EQ(NegotiateContentType("application/json", {"text/plain", "application/json"}), "application/json");
  EXPECT_EQ(NegotiateContentType("text/plain", {"text/plain", "application/json"}), "text/plain");
}

TEST(NegotiateContentTypeTest, QValuesAreHonored) {
  EXPECT_EQ(NegotiateContentType("text/plain;q=0.5, application/json", {"text/plain", "application/json"}),
            "application/json");
  EXPECT_EQ(NegotiateContentType("application/json;q=0.2, */*;q=0.9", {"text/plain", "application/json"}),
            "text/plain");
}

TEST(NegotiateContentTypeTest, SpecificRangeBeatsWildcardAtEqualQ) {
  EXPECT_EQ(NegotiateContentType("*/*, application/json", {"text/plain", "application/json"}), "application/json");
  EXPECT_EQ(NegotiateContentType("application/*", {"text/plain", "application/json"}), "application/json");
}

TEST(NegotiateContentTypeTest, NothingAcceptable) {
  EXPECT_EQ(NegotiateContentType("image/png", {"text/plain", "application/json"}), "");
  EXPECT_EQ(NegotiateContentType("text/plain;q=0", {"text/plain"}), "");
}

TEST(EncodingAcceptedTest, ExplicitAndWildcard) {
  EXPECT_TRUE(EncodingAccepted("gzip, br", "br"));
  EXPECT_TRUE(EncodingAccepted("BR;q=0.1", "br"));
  EXPECT_TRUE(EncodingAccepted("*", "br"));
  EXPECT_FALSE(EncodingAccepted("", "br"));
  EXPECT_FALSE(EncodingAccepted("gzip, deflate", "br"));
  EXPECT_FALSE(EncodingAccepted("br;q=0", "br"));
  EXPECT_FALSE(EncodingAccepted("*, br;q=0", "br"));
  EXPECT_FALSE(EncodingAccepted("*;q=0", "br"));
}

}  // namespace snowweb::http
