#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "snowweb/base-fd.hpp"

namespace snowweb {

struct InotifyEvent {
  // Full path of the affected entry ("<watched dir>/<name>"), or the directory itself when the event has no name.
  std::string path;
  uint32_t mask{};
};

// RAII wrapper over a non-blocking inotify instance watching directories.
class InotifyWatcher {
 public:
  InotifyWatcher();

  // Watch directory 'dir' for events in 'mask' (IN_* constants).
  // Watching the same directory twice is a no-op (logged).
  // Throws std::system_error on failure.
  void addWatch(const std::string& dir, uint32_t mask);

  // Reads all pending events. Returns an empty vector if none is pending.
  // Throws std::system_error on read failure, and std::runtime_error if the kernel event queue overflowed.
  [[nodiscard]] std::vector<InotifyEvent> readEvents();

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  [[nodiscard]] std::size_t nbWatches() const noexcept { return _watchedDirs.size(); }

 private:
  BaseFd _baseFd;
  std::unordered_map<int, std::string> _watchedDirs;
};

}  // namespace snowweb
