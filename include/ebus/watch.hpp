/**
 * @file watch.hpp
 * @brief Readiness primitives handed from a connection to its event loop.
 *
 * A Watch asks the loop to observe one fd; a Timeout asks it to fire an
 * interval timer. Both are created and destroyed by libdbus through the
 * DBusWatchRef/DBusTimeoutRef adapters below, which live exactly as long as
 * the libdbus object (they are stored as its data with a delete callback).
 *
 * Slot() belongs to the event loop: it keeps whatever registration state the
 * scheduler needs and is released in RemoveWatch()/RemoveTimeout().
 */

#ifndef EBUS_WATCH_HPP_
#define EBUS_WATCH_HPP_

#include "ebus/log.hpp"
#include "ebus/poller.hpp"

#include <dbus/dbus.h>

#include <cstdint>
#include <memory>

namespace ebus {

class Connection;

// ============================================================================
// Watch
// ============================================================================

class Watch {
 public:
  virtual ~Watch() = default;

  Watch(const Watch&) = delete;
  Watch& operator=(const Watch&) = delete;

  virtual int32_t Fd() const = 0;
  /** @brief Interest mask (IoEvent::kReadable / kWritable). */
  virtual uint8_t Flags() const = 0;
  virtual bool Enabled() const = 0;
  /** @brief Report observed readiness (any IoEvent bits). */
  virtual void Handle(uint8_t events) = 0;

  /** @brief Connection this watch serves; nullptr for a listening server. */
  Connection* Owner() const noexcept { return owner_; }
  std::shared_ptr<void>& Slot() noexcept { return slot_; }

 protected:
  explicit Watch(Connection* owner) noexcept : owner_(owner) {}

 private:
  Connection* owner_;
  std::shared_ptr<void> slot_;
};

// ============================================================================
// Timeout
// ============================================================================

class Timeout {
 public:
  virtual ~Timeout() = default;

  Timeout(const Timeout&) = delete;
  Timeout& operator=(const Timeout&) = delete;

  virtual int32_t IntervalMs() const = 0;
  virtual bool Enabled() const = 0;
  virtual void Handle() = 0;

  Connection* Owner() const noexcept { return owner_; }
  std::shared_ptr<void>& Slot() noexcept { return slot_; }

 protected:
  explicit Timeout(Connection* owner) noexcept : owner_(owner) {}

 private:
  Connection* owner_;
  std::shared_ptr<void> slot_;
};

// ============================================================================
// libdbus adapters
// ============================================================================

namespace detail {

class DBusWatchRef final : public Watch {
 public:
  DBusWatchRef(DBusWatch* raw, Connection* owner) noexcept
      : Watch(owner), raw_(raw) {}

  int32_t Fd() const override { return dbus_watch_get_unix_fd(raw_); }

  uint8_t Flags() const override {
    const unsigned int flags = dbus_watch_get_flags(raw_);
    uint8_t out = 0;
    if ((flags & DBUS_WATCH_READABLE) != 0U) {
      out |= static_cast<uint8_t>(IoEvent::kReadable);
    }
    if ((flags & DBUS_WATCH_WRITABLE) != 0U) {
      out |= static_cast<uint8_t>(IoEvent::kWritable);
    }
    return out;
  }

  bool Enabled() const override {
    return dbus_watch_get_enabled(raw_) != FALSE;
  }

  void Handle(uint8_t events) override {
    unsigned int flags = 0;
    if (HasEvent(events, IoEvent::kReadable)) flags |= DBUS_WATCH_READABLE;
    if (HasEvent(events, IoEvent::kWritable)) flags |= DBUS_WATCH_WRITABLE;
    if (HasEvent(events, IoEvent::kError)) flags |= DBUS_WATCH_ERROR;
    if (HasEvent(events, IoEvent::kHangup)) flags |= DBUS_WATCH_HANGUP;
    if (dbus_watch_handle(raw_, flags) == FALSE) {
      EBUS_LOG_WARN("watch", "out of memory handling fd %d", Fd());
    }
  }

  static void Delete(void* data) { delete static_cast<DBusWatchRef*>(data); }

 private:
  DBusWatch* raw_;
};

class DBusTimeoutRef final : public Timeout {
 public:
  DBusTimeoutRef(DBusTimeout* raw, Connection* owner) noexcept
      : Timeout(owner), raw_(raw) {}

  int32_t IntervalMs() const override {
    return dbus_timeout_get_interval(raw_);
  }

  bool Enabled() const override {
    return dbus_timeout_get_enabled(raw_) != FALSE;
  }

  void Handle() override {
    if (dbus_timeout_handle(raw_) == FALSE) {
      EBUS_LOG_WARN("watch", "out of memory handling timeout");
    }
  }

  static void Delete(void* data) { delete static_cast<DBusTimeoutRef*>(data); }

 private:
  DBusTimeout* raw_;
};

}  // namespace detail

}  // namespace ebus

#endif  // EBUS_WATCH_HPP_
