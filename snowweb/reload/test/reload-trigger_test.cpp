#include "snowweb/reload-trigger.hpp"

#include <gtest/gtest.h>
#include <signal.h>

namespace snowweb {

TEST(ReloadTriggerTest, Names) {
  EXPECT_EQ(ReloadKindName(ReloadKind::Shutdown), "shutdown");
  EXPECT_EQ(ReloadKindName(ReloadKind::RebuildContent), "rebuild-content");
  EXPECT_EQ(ReloadKindName(ReloadKind::ReloadTls), "reload-tls");
  EXPECT_EQ(TriggerSourceName(TriggerSource::FileChange), "file-change");
  EXPECT_EQ(TriggerSourceName(TriggerSource::Remote), "remote");
}

TEST(ReloadTriggerTest, DescribeOrigin) {
  EXPECT_EQ(DescribeOrigin(ReloadTrigger{ReloadKind::Shutdown, TriggerSource::Signal, SIGTERM, {}}), "signal SIGTERM");
  EXPECT_EQ(DescribeOrigin(ReloadTrigger{ReloadKind::ReloadTls, TriggerSource::FileChange, 0, "/etc/tls/cert.pem"}),
            "change of /etc/tls/cert.pem");
  EXPECT_EQ(DescribeOrigin(ReloadTrigger{ReloadKind::RebuildContent, TriggerSource::Programmatic, 0, {}}),
            "programmatic request");
}

}  // namespace snowweb
