#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "snowweb/file.hpp"

namespace snowweb {

// Blocking byte stream of one accepted connection (plain TCP / Unix socket, or TLS on top of it).
class ITransport {
 public:
  virtual ~ITransport() = default;

  // Returns the number of bytes read (> 0), 0 on orderly close, or -1 on error or receive timeout.
  virtual std::ptrdiff_t read(std::span<char> buf) = 0;

  // Writes all of 'data'. Returns false on failure.
  virtual bool writeAll(std::string_view data) = 0;

  // Writes bytes [offset, offset + length) of 'file'. Returns false on failure.
  virtual bool sendFile(const File& file, std::size_t offset, std::size_t length) = 0;

  // Best effort orderly close of the stream (TLS close_notify).
  virtual void shutdown() noexcept {}
};

class PlainTransport final : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  std::ptrdiff_t read(std::span<char> buf) override;

  bool writeAll(std::string_view data) override;

  // Uses sendfile(2).
  bool sendFile(const File& file, std::size_t offset, std::size_t length) override;

 private:
  int _fd;
};

}  // namespace snowweb
