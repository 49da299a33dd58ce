/**
 * @file event_loop.hpp
 * @brief Contract between a bus connection and the host scheduler.
 *
 * A connection never blocks on I/O itself. It registers Watches and Timeouts
 * with its EventLoop; the loop observes them, reports readiness back through
 * Watch::Handle()/Timeout::Handle() and then schedules a dispatch pass
 * (DrainDispatch) for the owning connection. Reporting and dispatching are
 * separate steps so that event delivery never re-enters message processing.
 *
 * Implementations: PollReactor (standalone poll(2) loop) and AsioLoop
 * (Boost.Asio io_context with fibers).
 */

#ifndef EBUS_EVENT_LOOP_HPP_
#define EBUS_EVENT_LOOP_HPP_

#include "ebus/error.hpp"
#include "ebus/log.hpp"
#include "ebus/vocabulary.hpp"
#include "ebus/watch.hpp"

#include <dbus/dbus.h>

namespace ebus {

class Connection;

class EventLoop {
 public:
  virtual ~EventLoop() = default;

  /** @brief Start observing @p watch if it is enabled. */
  virtual expected<void, Error> AddWatch(Watch& watch) = 0;
  /** @brief Stop observing and release Slot() state; safe if never enabled. */
  virtual void RemoveWatch(Watch& watch) = 0;
  /** @brief Enabled flag or interest changed; match observation to it. */
  virtual void WatchToggled(Watch& watch) = 0;

  virtual expected<void, Error> AddTimeout(Timeout& timeout) = 0;
  virtual void RemoveTimeout(Timeout& timeout) = 0;
  /**
   * @brief Enabled flag or interval changed.
   *
   * An interval change re-arms the timer so the next expiry follows the new
   * interval.
   */
  virtual void TimeoutToggled(Timeout& timeout) = 0;

  /** @brief @p conn will be drained after events and flushed on exit. */
  virtual void AttachConnection(Connection& conn) = 0;
  virtual void DetachConnection(Connection& conn) = 0;

  /**
   * @brief @p conn has queued messages outside any I/O event.
   *
   * May be called from any thread and with libdbus locks held; must only
   * schedule work.
   */
  virtual void Wakeup(Connection& conn) = 0;
};

// ============================================================================
// libdbus callback bindings
// ============================================================================

namespace detail {

/** @brief Callback data shared by DBusConnection and DBusServer hooks. */
struct LoopBinding {
  EventLoop* loop;
  Connection* owner;
};

inline dbus_bool_t AddWatchThunk(DBusWatch* raw, void* data) {
  auto* binding = static_cast<LoopBinding*>(data);
  auto* watch = new DBusWatchRef(raw, binding->owner);
  dbus_watch_set_data(raw, watch, &DBusWatchRef::Delete);
  auto r = binding->loop->AddWatch(*watch);
  if (!r) {
    EBUS_LOG_ERROR("loop", "add watch fd=%d failed: %s", watch->Fd(),
                   r.get_error().message.c_str());
    return FALSE;
  }
  return TRUE;
}

inline void RemoveWatchThunk(DBusWatch* raw, void* data) {
  auto* binding = static_cast<LoopBinding*>(data);
  auto* watch = static_cast<Watch*>(dbus_watch_get_data(raw));
  if (watch != nullptr) binding->loop->RemoveWatch(*watch);
}

inline void WatchToggledThunk(DBusWatch* raw, void* data) {
  auto* binding = static_cast<LoopBinding*>(data);
  auto* watch = static_cast<Watch*>(dbus_watch_get_data(raw));
  if (watch != nullptr) binding->loop->WatchToggled(*watch);
}

inline dbus_bool_t AddTimeoutThunk(DBusTimeout* raw, void* data) {
  auto* binding = static_cast<LoopBinding*>(data);
  auto* timeout = new DBusTimeoutRef(raw, binding->owner);
  dbus_timeout_set_data(raw, timeout, &DBusTimeoutRef::Delete);
  auto r = binding->loop->AddTimeout(*timeout);
  if (!r) {
    EBUS_LOG_ERROR("loop", "add timeout failed: %s",
                   r.get_error().message.c_str());
    return FALSE;
  }
  return TRUE;
}

inline void RemoveTimeoutThunk(DBusTimeout* raw, void* data) {
  auto* binding = static_cast<LoopBinding*>(data);
  auto* timeout = static_cast<Timeout*>(dbus_timeout_get_data(raw));
  if (timeout != nullptr) binding->loop->RemoveTimeout(*timeout);
}

inline void TimeoutToggledThunk(DBusTimeout* raw, void* data) {
  auto* binding = static_cast<LoopBinding*>(data);
  auto* timeout = static_cast<Timeout*>(dbus_timeout_get_data(raw));
  if (timeout != nullptr) binding->loop->TimeoutToggled(*timeout);
}

}  // namespace detail

}  // namespace ebus

#endif  // EBUS_EVENT_LOOP_HPP_
