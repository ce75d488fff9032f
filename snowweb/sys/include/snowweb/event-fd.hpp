#pragma once

#include <cstdint>

#include "snowweb/base-fd.hpp"

namespace snowweb {

// Non-blocking eventfd counter. Other threads notify() it to wake the event loop polling fd().
class EventFd {
 public:
  EventFd();

  void notify() const noexcept;

  // Resets the counter and returns the number of notifications since the previous drain (0 if none).
  std::uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace snowweb
