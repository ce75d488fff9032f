#pragma once

#include <signal.h>

#include <initializer_list>
#include <optional>

#include "snowweb/base-fd.hpp"

namespace snowweb {

// RAII wrapper over a Linux signalfd.
// The constructor blocks the given signals in the calling thread so that they are only delivered through the fd.
// It must therefore be created before any other thread is started, as threads inherit the signal mask of their
// creator. Signals stay blocked after destruction so that a pending one cannot fall back to its default action.
class SignalFd {
 public:
  explicit SignalFd(std::initializer_list<int> signals);

  // Reads the next pending signal number, or std::nullopt if none is pending.
  // Throws std::system_error on read failure.
  [[nodiscard]] std::optional<int> read() const;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace snowweb
