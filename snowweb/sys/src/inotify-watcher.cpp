#include "snowweb/inotify-watcher.hpp"

#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "snowweb/errno-throw.hpp"
#include "snowweb/log.hpp"

namespace snowweb {

InotifyWatcher::InotifyWatcher() : _baseFd(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC)) {
  if (!_baseFd) {
    ThrowErrno("inotify_init1 failed");
  }
  log::debug("InotifyWatcher fd # {} opened", _baseFd.fd());
}

void InotifyWatcher::addWatch(const std::string& dir, uint32_t mask) {
  const int wd = ::inotify_add_watch(_baseFd.fd(), dir.c_str(), mask);
  if (wd == -1) {
    ThrowErrno("inotify_add_watch failed for '{}'", dir);
  }
  auto [it, inserted] = _watchedDirs.emplace(wd, dir);
  if (!inserted) {
    log::debug("'{}' already watched (wd {})", dir, wd);
    return;
  }
  log::debug("Watching '{}' (wd {}, mask=0x{:x})", dir, wd, mask);
}

std::vector<InotifyEvent> InotifyWatcher::readEvents() {
  std::vector<InotifyEvent> events;
  alignas(inotify_event) std::array<char, 8192> buf;
  while (true) {
    const auto ret = ::read(_baseFd.fd(), buf.data(), buf.size());
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN) {
        break;
      }
      ThrowErrno("inotify read failed (fd # {})", _baseFd.fd());
    }
    for (std::size_t pos = 0; pos < static_cast<std::size_t>(ret);) {
      inotify_event event;
      std::memcpy(&event, buf.data() + pos, sizeof(event));
      if ((event.mask & IN_Q_OVERFLOW) != 0) {
        throw std::runtime_error("inotify event queue overflowed");
      }
      const auto it = _watchedDirs.find(event.wd);
      if (it != _watchedDirs.end()) {
        InotifyEvent& out = events.emplace_back();
        out.mask = event.mask;
        out.path = it->second;
        if (event.len != 0) {
          // name is NUL padded
          const char* name = buf.data() + pos + sizeof(inotify_event);
          out.path.push_back('/');
          out.path.append(name, ::strnlen(name, event.len));
        }
      }
      if ((event.mask & IN_IGNORED) != 0) {
        log::warn("Watch on '{}' removed by the kernel", it != _watchedDirs.end() ? it->second : std::string{});
        if (it != _watchedDirs.end()) {
          _watchedDirs.erase(it);
        }
      }
      pos += sizeof(inotify_event) + event.len;
    }
  }
  return events;
}

}  // namespace snowweb
