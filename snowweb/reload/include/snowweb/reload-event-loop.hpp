#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "snowweb/event-fd.hpp"
#include "snowweb/event-loop.hpp"
#include "snowweb/inotify-watcher.hpp"
#include "snowweb/reload-trigger.hpp"
#include "snowweb/signal-fd.hpp"

namespace snowweb {

class SiteCoordinator;
class TlsMaterialManager;

struct ReloadEventLoopConfig {
  // Files whose creation or rewrite triggers a content rebuild. An existing directory matches any entry in it.
  std::vector<std::string> rebuildWatchPaths;

  ReloadEventLoopConfig& withRebuildWatchPath(std::string path);
};

// Control loop of the process, run on the main thread.
//
// Multiplexes termination and reload signals (signalfd), changes of the TLS files and of the rebuild watch paths
// (inotify on their parent directories) and programmatic requests (eventfd). Rebuilds and TLS reloads run
// synchronously in the loop. Their failures are logged, the previous content or material staying active.
//
// Signals: SIGINT, SIGTERM shut down. SIGUSR1 rebuilds, SIGUSR2 reloads TLS material, SIGHUP does both.
class ReloadEventLoop {
 public:
  struct Stats {
    uint32_t rebuilds{};
    uint32_t rebuildFailures{};
    uint32_t tlsReloads{};
    uint32_t tlsReloadFailures{};
  };

  // Must be constructed before any other thread is started (see SignalFd).
  // 'tlsManager' may be null when serving plain HTTP.
  // Throws Error{Watch} if a signal or file watch cannot be set up.
  ReloadEventLoop(ReloadEventLoopConfig config, SiteCoordinator& coordinator, TlsMaterialManager* tlsManager);

  ReloadEventLoop(const ReloadEventLoop&) = delete;
  ReloadEventLoop& operator=(const ReloadEventLoop&) = delete;

  // Processes triggers until a shutdown is requested, and returns the shutdown trigger.
  // Throws Error{Watch} if reading file change events fails.
  ReloadTrigger run();

  // Queues a trigger for the loop. Thread safe.
  void post(ReloadTrigger trigger);

  // Makes run() return. Thread safe.
  void requestShutdown() { post(ReloadTrigger{ReloadKind::Shutdown, TriggerSource::Programmatic, 0, {}}); }

  // Number of directories watched for file changes.
  [[nodiscard]] std::size_t nbWatchedDirs() const noexcept { return _watcher.nbWatches(); }

  // Thread safe.
  [[nodiscard]] Stats stats() const noexcept;

 private:
  void watchFile(const std::string& path, std::unordered_set<std::string>& files);

  void watchPath(const std::string& path);

  [[nodiscard]] std::vector<ReloadTrigger> readSignals();

  [[nodiscard]] std::vector<ReloadTrigger> readFileChanges();

  [[nodiscard]] std::vector<ReloadTrigger> takePosted();

  // Applies a batch of triggers, coalescing duplicates. Returns the shutdown trigger if the batch contains one.
  std::optional<ReloadTrigger> dispatch(const std::vector<ReloadTrigger>& triggers);

  void rebuildContent(const ReloadTrigger& trigger);

  void reloadTls(const ReloadTrigger& trigger);

  SiteCoordinator& _coordinator;
  TlsMaterialManager* _tlsManager;

  SignalFd _signalFd;
  InotifyWatcher _watcher;
  EventFd _wakeupFd;
  EventLoop _loop;

  std::unordered_set<std::string> _tlsFiles;
  std::unordered_set<std::string> _rebuildFiles;
  std::unordered_set<std::string> _rebuildDirs;

  std::mutex _postedMutex;
  std::vector<ReloadTrigger> _posted;

  std::atomic<uint32_t> _rebuilds{0};
  std::atomic<uint32_t> _rebuildFailures{0};
  std::atomic<uint32_t> _tlsReloads{0};
  std::atomic<uint32_t> _tlsReloadFailures{0};
};

}  // namespace snowweb
