#include "snowweb/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "snowweb/errno-throw.hpp"
#include "snowweb/log.hpp"

namespace snowweb {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    ThrowErrno("eventfd failed");
  }
}

void EventFd::notify() const noexcept {
  // EAGAIN means the counter is saturated, the loop is woken anyway.
  if (::eventfd_write(fd(), 1) == -1 && errno != EAGAIN) {
    log::error("eventfd write failed on fd # {}: {}", fd(), std::strerror(errno));
  }
}

std::uint64_t EventFd::drain() const noexcept {
  eventfd_t count = 0;
  if (::eventfd_read(fd(), &count) == -1) {
    if (errno != EAGAIN) {
      log::error("eventfd read failed on fd # {}: {}", fd(), std::strerror(errno));
    }
    return 0;
  }
  return count;
}

}  // namespace snowweb
