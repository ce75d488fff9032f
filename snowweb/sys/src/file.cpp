#include "snowweb/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <span>
#include <string>
#include <system_error>

#include "snowweb/errno-throw.hpp"
#include "snowweb/log.hpp"

namespace snowweb {

File::File(const std::string& path) {
  std::error_code ec;
  *this = Open(path, ec);
  if (ec) {
    throw std::system_error(ec, "Unable to open file '" + path + "'");
  }
}

File File::Open(const std::string& path, std::error_code& ec) noexcept {
  File file;
  file._fd = BaseFd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!file._fd) {
    ec.assign(errno, std::generic_category());
    log::debug("Unable to open file '{}': {}", path, ec.message());
    return file;
  }
  struct stat st{};
  if (::fstat(file._fd.fd(), &st) != 0) {
    ec.assign(errno, std::generic_category());
    log::error("Unable to stat file '{}': {}", path, ec.message());
    file._fd.close();
    return file;
  }
  file._fileSize = static_cast<std::size_t>(st.st_size);
  file._mode = st.st_mode;
  ec.clear();
  return file;
}

bool File::isDirectory() const noexcept { return _fd && S_ISDIR(_mode); }

bool File::isRegular() const noexcept { return _fd && S_ISREG(_mode); }

std::size_t File::readAt(std::span<std::byte> dst, std::size_t offset) const {
  while (true) {
    const auto ret = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (ret >= 0) {
      return static_cast<std::size_t>(ret);
    }
    if (errno != EINTR) {
      const auto savedErr = errno;
      log::error("pread failed for fd # {} at offset {}: errno={}", _fd.fd(), offset, savedErr);
      errno = savedErr;
      return kError;
    }
  }
}

std::string File::loadAllContent() const {
  std::string content;
  content.reserve(_fileSize);
  std::array<std::byte, 8192> buf;
  for (std::size_t offset = 0;;) {
    const std::size_t nbRead = readAt(buf, offset);
    if (nbRead == kError) {
      ThrowErrno("Unable to read fd # {}", _fd.fd());
    }
    if (nbRead == 0) {
      break;
    }
    content.append(reinterpret_cast<const char*>(buf.data()), nbRead);
    offset += nbRead;
  }
  return content;
}

}  // namespace snowweb
