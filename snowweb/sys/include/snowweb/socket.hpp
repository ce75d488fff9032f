#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "snowweb/base-fd.hpp"

namespace snowweb {

// RAII listening stream socket (TCP, Unix domain or adopted from an inherited descriptor).
class Socket {
 public:
  static constexpr int kDefaultBacklog = 1024;

  Socket() noexcept = default;

  // Adopt an already listening socket descriptor.
  explicit Socket(BaseFd baseFd) noexcept : _baseFd(std::move(baseFd)) {}

  Socket(const Socket&) = delete;
  Socket(Socket&& other) noexcept;
  Socket& operator=(const Socket&) = delete;
  Socket& operator=(Socket&& other) noexcept;

  // Unlinks the socket path if this Socket created a Unix domain listener.
  ~Socket();

  // Resolve 'host' with getaddrinfo and listen on the first address that binds.
  // An empty port picks an ephemeral one. Throws std::system_error on failure.
  [[nodiscard]] static Socket ListenTcp(std::string_view host, std::string_view port, int backlog = kDefaultBacklog);

  // Bind a Unix domain socket at 'path' and listen. Throws std::system_error on failure.
  [[nodiscard]] static Socket ListenUnix(const std::string& path, int backlog = kDefaultBacklog);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Switch the descriptor to non-blocking mode. Throws std::system_error on failure.
  void setNonBlocking() const;

  // Accept a pending connection as a blocking, close-on-exec descriptor.
  // Returns a closed BaseFd if no connection is pending or on transient failure (logged).
  [[nodiscard]] BaseFd accept() const;

  // Human readable local address ("127.0.0.1:8080", "[::1]:8080", "unix:/run/snowweb.sock").
  [[nodiscard]] std::string localAddress() const;

  // Local port for inet sockets, 0 otherwise.
  [[nodiscard]] uint16_t localPort() const;

  void close() noexcept;

 private:
  BaseFd _baseFd;
  std::string _unlinkPath;
};

}  // namespace snowweb
