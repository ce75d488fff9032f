#pragma once

namespace snowweb {

// Owns one file descriptor and closes it on destruction. Move only.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { reset(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership, the caller becomes responsible for closing the returned descriptor.
  [[nodiscard]] int release() noexcept;

  // Closes the owned descriptor, if any, and takes ownership of 'fd'.
  void reset(int fd = kClosedFd) noexcept;

  void close() noexcept { reset(); }

 private:
  int _fd;
};

}  // namespace snowweb
