/**
 * @file poller.hpp
 * @brief Level-triggered poll(2) wrapper with a per-iteration interest set.
 *
 * The interest set is rebuilt before every Wait(): Clear(), then one Add()
 * per fd of interest. The same fd may be added more than once (libdbus keeps
 * separate read and write watches on one socket); each Add() gets its own
 * slot and results are read back per slot.
 */

#ifndef EBUS_POLLER_HPP_
#define EBUS_POLLER_HPP_

#include "ebus/platform.hpp"
#include "ebus/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <vector>

#include <poll.h>

namespace ebus {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kInvalidFd,
  kWaitFailed,
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError    = 0x04,
  kHangup   = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

inline constexpr bool HasEvent(uint8_t mask, IoEvent ev) {
  return (mask & static_cast<uint8_t>(ev)) != 0U;
}

struct PollResult {
  int32_t fd;
  uint8_t events;  // bitmask of IoEvent
};

// ============================================================================
// Poller
// ============================================================================

class Poller {
 public:
  Poller() = default;

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  /** @brief Forget the interest set of the previous iteration. */
  void Clear() noexcept { fds_.clear(); }

  /**
   * @brief Register interest for one iteration.
   * @return Slot index used with Result().
   */
  expected<uint32_t, PollerError> Add(int32_t fd, uint8_t events) {
    if (fd < 0) {
      return expected<uint32_t, PollerError>::error(PollerError::kInvalidFd);
    }
    struct pollfd p {};
    p.fd = fd;
    p.events = ToPoll(events);
    fds_.push_back(p);
    return expected<uint32_t, PollerError>::success(
        static_cast<uint32_t>(fds_.size() - 1U));
  }

  uint32_t Size() const noexcept { return static_cast<uint32_t>(fds_.size()); }

  /**
   * @brief Block until a registered fd is ready or @p timeout_ms elapses.
   *
   * EINTR is retried with the full timeout.
   * @return Number of ready slots.
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1) {
    for (;;) {
      int n = ::poll(fds_.data(), static_cast<nfds_t>(fds_.size()), timeout_ms);
      if (n >= 0) {
        return expected<uint32_t, PollerError>::success(
            static_cast<uint32_t>(n));
      }
      if (errno != EINTR) {
        return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
      }
    }
  }

  /** @brief Observed readiness of @p slot after the last Wait(). */
  PollResult Result(uint32_t slot) const noexcept {
    EBUS_ASSERT(slot < fds_.size());
    return PollResult{fds_[slot].fd, FromPoll(fds_[slot].revents)};
  }

 private:
  static short ToPoll(uint8_t events) noexcept {
    short p = 0;
    if (HasEvent(events, IoEvent::kReadable)) p |= POLLIN;
    if (HasEvent(events, IoEvent::kWritable)) p |= POLLOUT;
    return p;
  }

  static uint8_t FromPoll(short revents) noexcept {
    uint8_t ev = 0;
    if ((revents & POLLIN) != 0) ev |= static_cast<uint8_t>(IoEvent::kReadable);
    if ((revents & POLLOUT) != 0) ev |= static_cast<uint8_t>(IoEvent::kWritable);
    if ((revents & (POLLERR | POLLNVAL)) != 0) {
      ev |= static_cast<uint8_t>(IoEvent::kError);
    }
    if ((revents & POLLHUP) != 0) ev |= static_cast<uint8_t>(IoEvent::kHangup);
    return ev;
  }

  std::vector<struct pollfd> fds_;
};

}  // namespace ebus

#endif  // EBUS_POLLER_HPP_
