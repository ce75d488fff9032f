#include "snowweb/transport.hpp"

#include <sys/sendfile.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>

#include "snowweb/file.hpp"
#include "snowweb/log.hpp"

namespace snowweb {

std::ptrdiff_t PlainTransport::read(std::span<char> buf) {
  while (true) {
    const auto ret = ::recv(_fd, buf.data(), buf.size(), 0);
    if (ret >= 0) {
      return ret;
    }
    if (errno != EINTR) {
      log::trace("recv on fd # {} failed: {}", _fd, std::strerror(errno));
      return -1;
    }
  }
}

bool PlainTransport::writeAll(std::string_view data) {
  while (!data.empty()) {
    const auto ret = ::send(_fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      log::debug("send on fd # {} failed: {}", _fd, std::strerror(errno));
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(ret));
  }
  return true;
}

bool PlainTransport::sendFile(const File& file, std::size_t offset, std::size_t length) {
  auto off = static_cast<off_t>(offset);
  while (length != 0) {
    const auto ret = ::sendfile(_fd, file.fd(), &off, length);
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      log::debug("sendfile on fd # {} failed: {}", _fd, std::strerror(errno));
      return false;
    }
    if (ret == 0) {
      // file shrank since opening
      log::error("sendfile on fd # {} hit unexpected end of file", _fd);
      return false;
    }
    length -= static_cast<std::size_t>(ret);
  }
  return true;
}

}  // namespace snowweb
