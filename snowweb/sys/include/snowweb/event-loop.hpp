#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>
#include <vector>

#include "snowweb/base-fd.hpp"
#include "snowweb/event.hpp"
#include "snowweb/timedef.hpp"

namespace snowweb {

// Thin RAII wrapper over epoll.
//
// The event buffer starts with kInitialCapacity slots and doubles each time a poll saturates it.
// It never shrinks: poll cost is independent of capacity.
// add()/mod() return success/failure and log details on failure; caller decides the policy.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 16;

  struct EventFd {
    EventBmp eventBmp;
    int fd;
  };

  // Construct an EventLoop. A negative pollTimeout blocks indefinitely.
  // Throws std::system_error if epoll_create1 fails.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Log on error.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  //  - On success: returns a non-empty span of ready events, valid until next poll().
  //  - On timeout or EINTR: returns an empty span.
  // Throws std::system_error on unrecoverable epoll_wait failure.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _ready;
};

}  // namespace snowweb
