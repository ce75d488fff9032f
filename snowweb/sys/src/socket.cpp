#include "snowweb/socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "snowweb/errno-throw.hpp"
#include "snowweb/log.hpp"

namespace snowweb {

namespace {

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

constexpr std::size_t kUnixSocketMaxPath = sizeof(sockaddr_un::sun_path);

}  // namespace

Socket::Socket(Socket&& other) noexcept
    : _baseFd(std::move(other._baseFd)), _unlinkPath(std::exchange(other._unlinkPath, {})) {}

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    close();
    _baseFd = std::move(other._baseFd);
    _unlinkPath = std::exchange(other._unlinkPath, {});
  }
  return *this;
}

Socket::~Socket() { close(); }

void Socket::close() noexcept {
  _baseFd.close();
  if (!_unlinkPath.empty()) {
    if (::unlink(_unlinkPath.c_str()) != 0 && errno != ENOENT) {
      log::warn("Unable to unlink socket path '{}': {}", _unlinkPath, std::strerror(errno));
    }
    _unlinkPath.clear();
  }
}

Socket Socket::ListenTcp(std::string_view host, std::string_view port, int backlog) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

  const std::string hostStr(host);
  const std::string portStr = port.empty() ? std::string("0") : std::string(port);
  addrinfo* rawResult = nullptr;
  if (const int rc = ::getaddrinfo(hostStr.empty() ? nullptr : hostStr.c_str(), portStr.c_str(), &hints, &rawResult);
      rc != 0) {
    throw std::system_error(std::make_error_code(std::errc::address_not_available),
                            "getaddrinfo failed for '" + hostStr + ":" + portStr + "': " + ::gai_strerror(rc));
  }
  AddrInfoPtr result(rawResult, ::freeaddrinfo);

  int lastErr = EADDRNOTAVAIL;
  for (const addrinfo* ai = result.get(); ai != nullptr; ai = ai->ai_next) {
    BaseFd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
    if (!fd) {
      lastErr = errno;
      continue;
    }
    static constexpr int kEnable = 1;
    if (::setsockopt(fd.fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
      ThrowErrno("setsockopt(SO_REUSEADDR) failed");
    }
    if (::bind(fd.fd(), ai->ai_addr, ai->ai_addrlen) != 0 || ::listen(fd.fd(), backlog) != 0) {
      lastErr = errno;
      continue;
    }
    Socket sock(std::move(fd));
    log::debug("Listening on {} (fd # {})", sock.localAddress(), sock.fd());
    return sock;
  }
  throw std::system_error(lastErr, std::generic_category(),
                          "Unable to bind and listen on '" + hostStr + ":" + portStr + "'");
}

Socket Socket::ListenUnix(const std::string& path, int backlog) {
  if (path.empty() || path.size() >= kUnixSocketMaxPath) {
    throw std::system_error(std::make_error_code(std::errc::filename_too_long),
                            "Invalid unix socket path '" + path + "'");
  }
  BaseFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd) {
    ThrowErrno("Unable to create unix socket");
  }
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::memcpy(addr.sun_path, path.data(), path.size());
  if (::bind(fd.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    ThrowErrno("Unable to bind unix socket '{}'", path);
  }
  Socket sock(std::move(fd));
  sock._unlinkPath = path;
  if (::listen(sock.fd(), backlog) != 0) {
    ThrowErrno("Unable to listen on unix socket '{}'", path);
  }
  log::debug("Listening on unix:{} (fd # {})", path, sock.fd());
  return sock;
}

void Socket::setNonBlocking() const {
  const int flags = ::fcntl(_baseFd.fd(), F_GETFL, 0);
  if (flags == -1 || ::fcntl(_baseFd.fd(), F_SETFL, flags | O_NONBLOCK) == -1) {
    ThrowErrno("Unable to set fd # {} non-blocking", _baseFd.fd());
  }
}

BaseFd Socket::accept() const {
  while (true) {
    BaseFd cnx(::accept4(_baseFd.fd(), nullptr, nullptr, SOCK_CLOEXEC));
    if (cnx) {
      return cnx;
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err != EAGAIN && err != EWOULDBLOCK) {
      log::error("accept on fd # {} failed: {}", _baseFd.fd(), std::strerror(err));
    }
    return cnx;
  }
}

std::string Socket::localAddress() const {
  sockaddr_storage storage{};
  socklen_t len = sizeof(storage);
  if (::getsockname(_baseFd.fd(), reinterpret_cast<sockaddr*>(&storage), &len) != 0) {
    return "fd:" + std::to_string(_baseFd.fd());
  }
  std::array<char, INET6_ADDRSTRLEN> buf{};
  switch (storage.ss_family) {
    case AF_INET: {
      const auto* in = reinterpret_cast<const sockaddr_in*>(&storage);
      ::inet_ntop(AF_INET, &in->sin_addr, buf.data(), buf.size());
      return std::string(buf.data()) + ":" + std::to_string(ntohs(in->sin_port));
    }
    case AF_INET6: {
      const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&storage);
      ::inet_ntop(AF_INET6, &in6->sin6_addr, buf.data(), buf.size());
      return "[" + std::string(buf.data()) + "]:" + std::to_string(ntohs(in6->sin6_port));
    }
    case AF_UNIX: {
      const auto* un = reinterpret_cast<const sockaddr_un*>(&storage);
      return "unix:" + std::string(un->sun_path, ::strnlen(un->sun_path, kUnixSocketMaxPath));
    }
    default:
      return "fd:" + std::to_string(_baseFd.fd());
  }
}

uint16_t Socket::localPort() const {
  sockaddr_storage storage{};
  socklen_t len = sizeof(storage);
  if (::getsockname(_baseFd.fd(), reinterpret_cast<sockaddr*>(&storage), &len) != 0) {
    return 0;
  }
  if (storage.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
  }
  if (storage.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
  }
  return 0;
}

}  // namespace snowweb
