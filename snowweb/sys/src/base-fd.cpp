#include "snowweb/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "snowweb/log.hpp"

namespace snowweb {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    reset(other.release());
  }
  return *this;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::reset(int fd) noexcept {
  const int previous = std::exchange(_fd, fd);
  if (previous == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even when close is interrupted: never retry it.
  if (::close(previous) != 0 && errno != EINTR) {
    log::warn("Unable to close fd # {}: {}", previous, std::strerror(errno));
    return;
  }
  log::trace("fd # {} closed", previous);
}

}  // namespace snowweb
