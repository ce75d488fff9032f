#include "snowweb/signal-fd.hpp"

#include <pthread.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <initializer_list>
#include <optional>
#include <system_error>

#include "snowweb/errno-throw.hpp"
#include "snowweb/log.hpp"

namespace snowweb {

namespace {

int CreateSignalFd(std::initializer_list<int> signals) {
  sigset_t mask;
  ::sigemptyset(&mask);
  for (int sig : signals) {
    ::sigaddset(&mask, sig);
  }
  if (const int err = ::pthread_sigmask(SIG_BLOCK, &mask, nullptr); err != 0) {
    throw std::system_error(err, std::generic_category(), "pthread_sigmask failed");
  }
  const int fd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
  if (fd == -1) {
    ThrowErrno("signalfd failed");
  }
  return fd;
}

}  // namespace

SignalFd::SignalFd(std::initializer_list<int> signals) : _baseFd(CreateSignalFd(signals)) {
  log::debug("SignalFd fd # {} opened for {} signals", _baseFd.fd(), signals.size());
}

std::optional<int> SignalFd::read() const {
  signalfd_siginfo info;
  while (true) {
    const auto ret = ::read(_baseFd.fd(), &info, sizeof(info));
    if (ret == static_cast<ssize_t>(sizeof(info))) {
      return static_cast<int>(info.ssi_signo);
    }
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    if (ret == -1 && errno == EAGAIN) {
      return std::nullopt;
    }
    ThrowErrno("signalfd read failed (fd # {})", _baseFd.fd());
  }
}

}  // namespace snowweb
