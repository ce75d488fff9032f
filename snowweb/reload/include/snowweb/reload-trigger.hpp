#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace snowweb {

enum class ReloadKind : std::uint8_t { Shutdown, RebuildContent, ReloadTls };

enum class TriggerSource : std::uint8_t { Signal, FileChange, Remote, Programmatic };

// One request for the control loop. 'signal' is set for Signal triggers, 'path' for FileChange triggers.
struct ReloadTrigger {
  ReloadKind kind{ReloadKind::Shutdown};
  TriggerSource source{TriggerSource::Programmatic};
  int signal{0};
  std::string path;

  bool operator==(const ReloadTrigger&) const = default;
};

[[nodiscard]] std::string_view ReloadKindName(ReloadKind kind) noexcept;

[[nodiscard]] std::string_view TriggerSourceName(TriggerSource source) noexcept;

// Human readable origin, for instance "signal SIGHUP" or "change of /etc/tls/cert.pem".
[[nodiscard]] std::string DescribeOrigin(const ReloadTrigger& trigger);

}  // namespace snowweb
