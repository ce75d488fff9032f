#include "snowweb/listener-address.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <charconv>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <type_traits>
#include <variant>

#include "snowweb/base-fd.hpp"
#include "snowweb/error.hpp"
#include "snowweb/log.hpp"
#include "snowweb/socket.hpp"

namespace snowweb {

namespace {

[[noreturn]] void ThrowParseError(std::string_view text, const char* reason) {
  throw Error(ErrorKind::ListenerParse, reason, {{"address", std::string(text)}});
}

bool ParseNonNegativeInt(std::string_view str, int& value) {
  const auto* first = str.data();
  const auto* last = str.data() + str.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  return !str.empty() && ec == std::errc{} && ptr == last && value >= 0;
}

TcpListenerAddress ParseTcpAddress(std::string_view text, std::string_view address) {
  TcpListenerAddress tcp;
  std::string_view portPart;
  if (address.starts_with('[')) {
    const auto closing = address.find(']');
    if (closing == std::string_view::npos) {
      ThrowParseError(text, "missing ']' in address");
    }
    tcp.host.assign(address.substr(1, closing - 1));
    const auto rest = address.substr(closing + 1);
    if (!rest.starts_with(':')) {
      ThrowParseError(text, "missing port in address");
    }
    portPart = rest.substr(1);
  } else {
    const auto colon = address.rfind(':');
    if (colon == std::string_view::npos) {
      ThrowParseError(text, "missing port in address");
    }
    if (address.substr(0, colon).contains(':')) {
      ThrowParseError(text, "too many colons in address");
    }
    tcp.host.assign(address.substr(0, colon));
    portPart = address.substr(colon + 1);
  }
  int port = 0;
  if (!portPart.empty() && (!ParseNonNegativeInt(portPart, port) || port > 65535)) {
    ThrowParseError(text, "invalid port");
  }
  tcp.port.assign(portPart);
  return tcp;
}

}  // namespace

ListenerAddress ParseListenerAddress(std::string_view text) {
  const auto sep = text.find(':');
  if (sep == std::string_view::npos) {
    ThrowParseError(text, "missing network/address separator");
  }
  const std::string_view network = text.substr(0, sep);
  const std::string_view address = text.substr(sep + 1);

  if (network == "tcp") {
    return ParseTcpAddress(text, address);
  }
  if (network == "unix") {
    if (address.empty()) {
      ThrowParseError(text, "empty unix socket path");
    }
    return UnixListenerAddress{std::string(address)};
  }
  if (network == "fd") {
    int fd = 0;
    if (!ParseNonNegativeInt(address, fd)) {
      ThrowParseError(text, "invalid file descriptor number");
    }
    return InheritedFdAddress{fd};
  }
  if (network == "systemd") {
    return ActivatedFdAddress{std::string(address)};
  }
  ThrowParseError(text, "unknown network");
}

std::string ToString(const ListenerAddress& address) {
  return std::visit(
      [](const auto& addr) -> std::string {
        using T = std::decay_t<decltype(addr)>;
        if constexpr (std::is_same_v<T, TcpListenerAddress>) {
          if (addr.host.contains(':')) {
            return "tcp:[" + addr.host + "]:" + addr.port;
          }
          return "tcp:" + addr.host + ":" + addr.port;
        } else if constexpr (std::is_same_v<T, UnixListenerAddress>) {
          return "unix:" + addr.path;
        } else if constexpr (std::is_same_v<T, InheritedFdAddress>) {
          return "fd:" + std::to_string(addr.fd);
        } else {
          return "systemd:" + addr.name;
        }
      },
      address);
}

ActivatedFds ActivatedFdsFromEnvironment(bool unsetEnvironment) {
  ActivatedFds activated;

  const char* listenPid = std::getenv("LISTEN_PID");
  const char* listenFds = std::getenv("LISTEN_FDS");
  const char* listenFdNames = std::getenv("LISTEN_FDNAMES");

  int pid = 0;
  int nbFds = 0;
  const bool forUs = listenPid != nullptr && listenFds != nullptr && ParseNonNegativeInt(listenPid, pid) &&
                     pid == ::getpid() && ParseNonNegativeInt(listenFds, nbFds);

  if (forUs) {
    std::string_view names = listenFdNames == nullptr ? std::string_view{} : std::string_view(listenFdNames);
    for (int idx = 0; idx < nbFds; ++idx) {
      const int fd = ActivatedFds::kListenFdsStart + idx;
      activated.fds.push_back(fd);
      const auto colon = names.find(':');
      std::string_view name = names.substr(0, colon);
      activated.names.emplace_back(name.empty() ? std::string_view("unknown") : name);
      names = colon == std::string_view::npos ? std::string_view{} : names.substr(colon + 1);
      if (unsetEnvironment) {
        const int flags = ::fcntl(fd, F_GETFD);
        if (flags != -1) {
          ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
        }
      }
    }
    log::debug("Received {} socket(s) from the service supervisor", nbFds);
  }

  if (unsetEnvironment) {
    ::unsetenv("LISTEN_PID");
    ::unsetenv("LISTEN_FDS");
    ::unsetenv("LISTEN_FDNAMES");
  }
  return activated;
}

int SelectActivatedFd(const ActivatedFds& activated, std::string_view name) {
  if (activated.fds.empty()) {
    throw Error(ErrorKind::NoSocketsPassed, "no sockets passed by the service supervisor");
  }
  if (name.empty()) {
    return activated.fds.front();
  }
  for (std::size_t idx = 0; idx < activated.fds.size(); ++idx) {
    if (activated.names[idx] == name) {
      return activated.fds[idx];
    }
  }
  throw Error(ErrorKind::ListenerLookup, "named socket not passed by the service supervisor",
              {{"name", std::string(name)}});
}

Socket ResolveListener(const ListenerAddress& address) {
  try {
    return std::visit(
        [](const auto& addr) -> Socket {
          using T = std::decay_t<decltype(addr)>;
          if constexpr (std::is_same_v<T, TcpListenerAddress>) {
            return Socket::ListenTcp(addr.host, addr.port);
          } else if constexpr (std::is_same_v<T, UnixListenerAddress>) {
            return Socket::ListenUnix(addr.path);
          } else if constexpr (std::is_same_v<T, InheritedFdAddress>) {
            const int flags = ::fcntl(addr.fd, F_GETFD);
            if (flags == -1) {
              throw std::system_error(errno, std::generic_category(),
                                      "inherited descriptor " + std::to_string(addr.fd) + " is not open");
            }
            // not passed on to spawned builders
            if (::fcntl(addr.fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
              throw std::system_error(errno, std::generic_category(),
                                      "unable to set close-on-exec on descriptor " + std::to_string(addr.fd));
            }
            return Socket(BaseFd(addr.fd));
          } else {
            return Socket(BaseFd(SelectActivatedFd(ActivatedFdsFromEnvironment(), addr.name)));
          }
        },
        address);
  } catch (const Error&) {
    throw;
  } catch (const std::system_error&) {
    ThrowWithCause(ErrorKind::Io, "could not create listening socket", {{"address", ToString(address)}});
  }
}

}  // namespace snowweb
