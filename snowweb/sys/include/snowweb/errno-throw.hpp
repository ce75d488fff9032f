#pragma once

#include <cerrno>
#include <format>
#include <system_error>
#include <utility>

namespace snowweb {

// Throws std::system_error for the current errno, the message being formatted from 'fmt' and 'args'.
//   ThrowErrno("Unable to bind unix socket '{}'", path);
template <typename... Args>
[[noreturn]] void ThrowErrno(std::format_string<Args...> fmt, Args&&... args) {
  const int err = errno;
  throw std::system_error(err, std::generic_category(), std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace snowweb
