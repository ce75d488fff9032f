#include "snowweb/signal-fd.hpp"

#include <gtest/gtest.h>
#include <signal.h>

namespace snowweb {

TEST(SignalFdTest, ReceivesBlockedSignal) {
  SignalFd signalFd({SIGUSR1, SIGHUP});
  EXPECT_FALSE(signalFd.read().has_value());

  ASSERT_EQ(::raise(SIGUSR1), 0);
  const auto sig = signalFd.read();
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(*sig, SIGUSR1);
  EXPECT_FALSE(signalFd.read().has_value());
}

TEST(SignalFdTest, MultiplePendingSignals) {
  SignalFd signalFd({SIGUSR1, SIGHUP});
  ASSERT_EQ(::raise(SIGHUP), 0);
  ASSERT_EQ(::raise(SIGUSR1), 0);
  int seen = 0;
  while (auto sig = signalFd.read()) {
    EXPECT_TRUE(*sig == SIGHUP || *sig == SIGUSR1);
    ++seen;
  }
  EXPECT_EQ(seen, 2);
}

}  // namespace snowweb
