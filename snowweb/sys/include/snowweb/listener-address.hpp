#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "snowweb/socket.hpp"

namespace snowweb {

struct TcpListenerAddress {
  std::string host;  // without brackets for IPv6 literals; empty means all interfaces
  std::string port;  // empty means ephemeral

  bool operator==(const TcpListenerAddress&) const = default;
};

struct UnixListenerAddress {
  std::string path;

  bool operator==(const UnixListenerAddress&) const = default;
};

// An already open listening descriptor inherited from the parent process.
struct InheritedFdAddress {
  int fd{};

  bool operator==(const InheritedFdAddress&) const = default;
};

// A descriptor passed by a service supervisor (socket activation), selected by name.
// An empty name selects the first passed descriptor.
struct ActivatedFdAddress {
  std::string name;

  bool operator==(const ActivatedFdAddress&) const = default;
};

using ListenerAddress = std::variant<TcpListenerAddress, UnixListenerAddress, InheritedFdAddress, ActivatedFdAddress>;

// Parses "<network>:<address>" with network in {tcp, unix, fd, systemd}.
// Throws snowweb::Error of kind ListenerParse on malformed input.
[[nodiscard]] ListenerAddress ParseListenerAddress(std::string_view text);

[[nodiscard]] std::string ToString(const ListenerAddress& address);

// Descriptors handed over through the socket activation protocol, starting at descriptor 3.
struct ActivatedFds {
  static constexpr int kListenFdsStart = 3;

  std::vector<int> fds;
  std::vector<std::string> names;  // same size as fds
};

// Reads LISTEN_PID, LISTEN_FDS and LISTEN_FDNAMES. Descriptors are only considered if LISTEN_PID matches the
// current process. If 'unsetEnvironment' is true, the variables are removed so that child processes do not
// inherit them, and passed descriptors are marked close-on-exec.
[[nodiscard]] ActivatedFds ActivatedFdsFromEnvironment(bool unsetEnvironment = true);

// Returns the descriptor named 'name' (or the first one if 'name' is empty).
// Throws snowweb::Error of kind NoSocketsPassed if 'activated' is empty, ListenerLookup if 'name' is unknown.
[[nodiscard]] int SelectActivatedFd(const ActivatedFds& activated, std::string_view name);

// Produces a listening socket for 'address'. No retries are performed.
// Throws snowweb::Error (ListenerLookup, NoSocketsPassed, or Io with the system error as nested cause).
[[nodiscard]] Socket ResolveListener(const ListenerAddress& address);

}  // namespace snowweb
