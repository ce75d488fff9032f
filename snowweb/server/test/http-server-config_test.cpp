#include "snowweb/http-server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace snowweb {

using namespace std::chrono_literals;

TEST(HttpServerConfigTest, DefaultsAreValid) {
  HttpServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_TRUE(config.enableKeepAlive);
  EXPECT_EQ(config.drainTimeout, 30s);
  EXPECT_EQ(config.maxHeaderBytes, 16UL * 1024UL);
  EXPECT_EQ(config.serverName, "snowweb");
}

TEST(HttpServerConfigTest, BuilderSetters) {
  HttpServerConfig config;
  config.withKeepAliveMode(false)
      .withKeepAliveTimeout(1s)
      .withIoTimeout(2s)
      .withTlsHandshakeTimeout(3s)
      .withDrainTimeout(4s)
      .withMaxHeaderBytes(4096)
      .withMaxBodyBytes(10)
      .withServerName("test");
  EXPECT_FALSE(config.enableKeepAlive);
  EXPECT_EQ(config.keepAliveTimeout, 1s);
  EXPECT_EQ(config.ioTimeout, 2s);
  EXPECT_EQ(config.tlsHandshakeTimeout, 3s);
  EXPECT_EQ(config.drainTimeout, 4s);
  EXPECT_EQ(config.maxHeaderBytes, 4096U);
  EXPECT_EQ(config.maxBodyBytes, 10U);
  EXPECT_EQ(config.serverName, "test");
  EXPECT_NO_THROW(config.validate());
}

TEST(HttpServerConfigTest, ZeroDrainTimeoutIsAllowed) {
  EXPECT_NO_THROW(HttpServerConfig{}.withDrainTimeout(0s).validate());
}

TEST(HttpServerConfigTest, InvalidValuesThrow) {
  EXPECT_THROW(HttpServerConfig{}.withMaxHeaderBytes(16).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withKeepAliveTimeout(0ms).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withIoTimeout(-1ms).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withTlsHandshakeTimeout(0ms).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withDrainTimeout(-1s).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withServerName("bad\r\nname").validate(), std::invalid_argument);
}

}  // namespace snowweb
