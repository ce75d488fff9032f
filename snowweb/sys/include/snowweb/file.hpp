#pragma once

#include <sys/types.h>

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <system_error>

#include "snowweb/base-fd.hpp"

namespace snowweb {

// Read-only file opened once, with its type and size captured at opening time.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. Throws std::system_error (carrying the open(2) errno) on failure.
  explicit File(const std::string& path);

  // Non throwing variant of the constructor. On failure, 'ec' is set and the returned File is closed.
  [[nodiscard]] static File Open(const std::string& path, std::error_code& ec) noexcept;

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  [[nodiscard]] bool isDirectory() const noexcept;

  [[nodiscard]] bool isRegular() const noexcept;

  // Return the file size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read up to dst.size() bytes starting at the given absolute offset.
  // Uses pread() so it does not modify the file's current offset.
  // Returns the number of bytes read (0 on EOF). Returns kError on error.
  [[nodiscard]] std::size_t readAt(std::span<std::byte> dst, std::size_t offset) const;

  // Read the whole file. Throws std::system_error on failure.
  [[nodiscard]] std::string loadAllContent() const;

  // The caller does NOT take ownership of the descriptor.
  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
  std::size_t _fileSize{0};
  mode_t _mode{0};
};

}  // namespace snowweb
