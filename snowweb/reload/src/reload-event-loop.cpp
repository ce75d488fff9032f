#include "snowweb/reload-event-loop.hpp"

#include <signal.h>
#include <sys/inotify.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

#include "snowweb/error.hpp"
#include "snowweb/event.hpp"
#include "snowweb/log.hpp"
#include "snowweb/site-coordinator.hpp"
#include "snowweb/tls-material-manager.hpp"

namespace snowweb {

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO;

template <class T, class... Args>
T MakeWatchResource(std::string_view what, Args&&... args) {
  try {
    return T(std::forward<Args>(args)...);
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::Watch, "unable to create " + std::string(what));
  }
}

std::filesystem::path NormalizedAbsolute(const std::string& path) {
  auto normal = std::filesystem::absolute(path).lexically_normal();
  if (!normal.has_filename()) {
    normal = normal.parent_path();
  }
  return normal;
}

ReloadTrigger SignalTrigger(ReloadKind kind, int sig) { return ReloadTrigger{kind, TriggerSource::Signal, sig, {}}; }

}  // namespace

ReloadEventLoopConfig& ReloadEventLoopConfig::withRebuildWatchPath(std::string path) {
  rebuildWatchPaths.push_back(std::move(path));
  return *this;
}

ReloadEventLoop::ReloadEventLoop(ReloadEventLoopConfig config, SiteCoordinator& coordinator,
                                 TlsMaterialManager* tlsManager)
    : _coordinator(coordinator),
      _tlsManager(tlsManager),
      _signalFd(MakeWatchResource<SignalFd>("signalfd", std::initializer_list<int>{SIGINT, SIGTERM, SIGHUP, SIGUSR1,
                                                                                   SIGUSR2})),
      _watcher(MakeWatchResource<InotifyWatcher>("inotify watcher")),
      _wakeupFd(MakeWatchResource<EventFd>("eventfd")),
      _loop(MakeWatchResource<EventLoop>("event loop", SysDuration(-1))) {
  try {
    _loop.addOrThrow(EventLoop::EventFd{EventIn, _signalFd.fd()});
    _loop.addOrThrow(EventLoop::EventFd{EventIn, _watcher.fd()});
    _loop.addOrThrow(EventLoop::EventFd{EventIn, _wakeupFd.fd()});
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::Watch, "unable to register control loop sources");
  }
  if (_tlsManager != nullptr) {
    for (const auto& file : _tlsManager->source().watchedFiles()) {
      watchFile(file, _tlsFiles);
    }
  }
  for (const auto& path : config.rebuildWatchPaths) {
    watchPath(path);
  }
}

void ReloadEventLoop::watchFile(const std::string& path, std::unordered_set<std::string>& files) {
  try {
    const auto file = NormalizedAbsolute(path);
    _watcher.addWatch(file.parent_path().string(), kWatchMask);
    files.insert(file.string());
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::Watch, "unable to watch file", {{"path", path}});
  }
}

void ReloadEventLoop::watchPath(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    watchFile(path, _rebuildFiles);
    return;
  }
  try {
    const auto dir = NormalizedAbsolute(path);
    _watcher.addWatch(dir.string(), kWatchMask);
    _rebuildDirs.insert(dir.string());
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::Watch, "unable to watch directory", {{"path", path}});
  }
}

ReloadTrigger ReloadEventLoop::run() {
  log::info("Control loop started, watching {} director{}", nbWatchedDirs(), nbWatchedDirs() == 1 ? "y" : "ies");
  while (true) {
    std::vector<ReloadTrigger> batch;
    for (const auto& event : _loop.poll()) {
      std::vector<ReloadTrigger> triggers;
      if (event.fd == _signalFd.fd()) {
        triggers = readSignals();
      } else if (event.fd == _watcher.fd()) {
        triggers = readFileChanges();
      } else if (event.fd == _wakeupFd.fd()) {
        _wakeupFd.drain();
        triggers = takePosted();
      }
      batch.insert(batch.end(), std::make_move_iterator(triggers.begin()), std::make_move_iterator(triggers.end()));
    }
    if (auto shutdown = dispatch(batch)) {
      return *std::move(shutdown);
    }
  }
}

void ReloadEventLoop::post(ReloadTrigger trigger) {
  {
    std::lock_guard<std::mutex> lock(_postedMutex);
    _posted.push_back(std::move(trigger));
  }
  _wakeupFd.notify();
}

ReloadEventLoop::Stats ReloadEventLoop::stats() const noexcept {
  return Stats{_rebuilds.load(), _rebuildFailures.load(), _tlsReloads.load(), _tlsReloadFailures.load()};
}

std::vector<ReloadTrigger> ReloadEventLoop::readSignals() {
  std::vector<ReloadTrigger> triggers;
  while (true) {
    std::optional<int> sig;
    try {
      sig = _signalFd.read();
    } catch (const std::exception&) {
      ThrowWithCause(ErrorKind::Watch, "unable to read signals");
    }
    if (!sig) {
      break;
    }
    switch (*sig) {
      case SIGINT:
      case SIGTERM:
        triggers.push_back(SignalTrigger(ReloadKind::Shutdown, *sig));
        break;
      case SIGHUP:
        triggers.push_back(SignalTrigger(ReloadKind::RebuildContent, *sig));
        triggers.push_back(SignalTrigger(ReloadKind::ReloadTls, *sig));
        break;
      case SIGUSR1:
        triggers.push_back(SignalTrigger(ReloadKind::RebuildContent, *sig));
        break;
      case SIGUSR2:
        triggers.push_back(SignalTrigger(ReloadKind::ReloadTls, *sig));
        break;
      default:
        log::warn("Ignoring unexpected signal {}", *sig);
        break;
    }
  }
  return triggers;
}

std::vector<ReloadTrigger> ReloadEventLoop::readFileChanges() {
  std::vector<InotifyEvent> events;
  try {
    events = _watcher.readEvents();
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::Watch, "file watcher failed");
  }
  std::vector<ReloadTrigger> triggers;
  for (auto& event : events) {
    log::trace("inotify event 0x{:x} on '{}'", event.mask, event.path);
    if (_tlsFiles.contains(event.path)) {
      triggers.push_back(ReloadTrigger{ReloadKind::ReloadTls, TriggerSource::FileChange, 0, event.path});
    }
    const auto slash = event.path.rfind('/');
    if (_rebuildFiles.contains(event.path) ||
        (slash != std::string::npos && _rebuildDirs.contains(event.path.substr(0, slash)))) {
      triggers.push_back(ReloadTrigger{ReloadKind::RebuildContent, TriggerSource::FileChange, 0, event.path});
    }
  }
  return triggers;
}

std::vector<ReloadTrigger> ReloadEventLoop::takePosted() {
  std::vector<ReloadTrigger> posted;
  std::lock_guard<std::mutex> lock(_postedMutex);
  posted.swap(_posted);
  return posted;
}

std::optional<ReloadTrigger> ReloadEventLoop::dispatch(const std::vector<ReloadTrigger>& triggers) {
  const ReloadTrigger* rebuild = nullptr;
  const ReloadTrigger* tls = nullptr;
  for (const auto& trigger : triggers) {
    switch (trigger.kind) {
      case ReloadKind::Shutdown:
        log::info("Shutting down on {}", DescribeOrigin(trigger));
        return trigger;
      case ReloadKind::RebuildContent:
        if (rebuild == nullptr) {
          rebuild = &trigger;
        } else {
          log::debug("Rebuild on {} merged with pending one", DescribeOrigin(trigger));
        }
        break;
      case ReloadKind::ReloadTls:
        if (tls == nullptr) {
          tls = &trigger;
        } else {
          log::debug("TLS reload on {} merged with pending one", DescribeOrigin(trigger));
        }
        break;
      default:
        break;
    }
  }
  if (rebuild != nullptr) {
    rebuildContent(*rebuild);
  }
  if (tls != nullptr) {
    reloadTls(*tls);
  }
  return std::nullopt;
}

void ReloadEventLoop::rebuildContent(const ReloadTrigger& trigger) {
  log::info("Rebuilding content on {}", DescribeOrigin(trigger));
  try {
    (void)_coordinator.rebuild();
    ++_rebuilds;
  } catch (const std::exception& ex) {
    ++_rebuildFailures;
    log::error("Rebuild failed, previous content stays active: {}", FormatErrorChain(ex));
  }
}

void ReloadEventLoop::reloadTls(const ReloadTrigger& trigger) {
  if (_tlsManager == nullptr) {
    log::debug("Ignoring TLS reload on {}: TLS is not enabled", DescribeOrigin(trigger));
    return;
  }
  log::info("Reloading TLS material on {}", DescribeOrigin(trigger));
  try {
    if (_tlsManager->reload()) {
      log::info("New TLS material active");
    } else {
      log::info("TLS material unchanged");
    }
    ++_tlsReloads;
  } catch (const std::exception& ex) {
    ++_tlsReloadFailures;
    log::error("TLS reload failed, previous material stays active: {}", FormatErrorChain(ex));
  }
}

}  // namespace snowweb
