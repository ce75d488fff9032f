#include "snowweb/reload-trigger.hpp"

#include <string.h>

#include <string>
#include <string_view>

namespace snowweb {

std::string_view ReloadKindName(ReloadKind kind) noexcept {
  switch (kind) {
    case ReloadKind::Shutdown:
      return "shutdown";
    case ReloadKind::RebuildContent:
      return "rebuild-content";
    case ReloadKind::ReloadTls:
      return "reload-tls";
    default:
      return "unknown";
  }
}

std::string_view TriggerSourceName(TriggerSource source) noexcept {
  switch (source) {
    case TriggerSource::Signal:
      return "signal";
    case TriggerSource::FileChange:
      return "file-change";
    case TriggerSource::Remote:
      return "remote";
    case TriggerSource::Programmatic:
      return "programmatic";
    default:
      return "unknown";
  }
}

std::string DescribeOrigin(const ReloadTrigger& trigger) {
  std::string out;
  switch (trigger.source) {
    case TriggerSource::Signal: {
      out.append("signal SIG");
      const char* abbrev = ::sigabbrev_np(trigger.signal);
      out.append(abbrev != nullptr ? abbrev : std::to_string(trigger.signal).c_str());
      break;
    }
    case TriggerSource::FileChange:
      out.append("change of ").append(trigger.path);
      break;
    default:
      out.append(TriggerSourceName(trigger.source)).append(" request");
      break;
  }
  return out;
}

}  // namespace snowweb
