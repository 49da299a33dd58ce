/**
 * @file asio_loop.hpp
 * @brief EventLoop adapter over boost::asio::io_context with fiber calls.
 *
 * Watches become stream_descriptor waits (one descriptor per fd, shared by
 * the read and write watches libdbus creates for it), timeouts become
 * steady_timers. Readiness is reported to libdbus from the completion
 * handler; the dispatch pass itself is posted, once per connection, so event
 * delivery never re-enters message processing.
 *
 * The io_context must be run by a single thread, and the connections bound
 * to this loop must be driven from that thread. Wakeup() is the exception
 * and may be called from anywhere.
 *
 * Blocking-style calls suspend a fiber (boost::asio::spawn):
 * @code
 *   boost::asio::spawn(io, [&](boost::asio::yield_context yield) {
 *     auto r = loop.Call(conn, request, 1000, yield);
 *   });
 * @endcode
 * Handlers run through FiberSpawner() each get their own fiber and may use
 * the yield-less Call() overload.
 */

#ifndef EBUS_ASIO_LOOP_HPP_
#define EBUS_ASIO_LOOP_HPP_

#include "ebus/call.hpp"
#include "ebus/connection.hpp"
#include "ebus/dispatch.hpp"
#include "ebus/error.hpp"
#include "ebus/event_loop.hpp"
#include "ebus/log.hpp"
#include "ebus/watch.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ebus {

class AsioLoop final : public EventLoop {
 public:
  /// Completion signature of AsyncCall(). The error code is set only when the
  /// call could not be sent; error replies arrive as error-type messages.
  using CallSignature = void(boost::system::error_code, Message);

  explicit AsioLoop(boost::asio::io_context& io) : io_(io) {}

  ~AsioLoop() override {
    for (auto& kv : fds_) kv.second->Shutdown();
    for (auto& kv : timers_) kv.second->Shutdown();
  }

  AsioLoop(const AsioLoop&) = delete;
  AsioLoop& operator=(const AsioLoop&) = delete;

  boost::asio::io_context& Context() noexcept { return io_; }

  // --- EventLoop ---

  expected<void, Error> AddWatch(Watch& watch) override {
    const int32_t fd = watch.Fd();
    auto& state = fds_[fd];
    if (state == nullptr) {
      state = std::make_shared<FdState>(io_);
      boost::system::error_code ec;
      state->descriptor.assign(fd, ec);
      if (ec) {
        fds_.erase(fd);
        return expected<void, Error>::error(
            Error(errors::kIoError, "assign fd: " + ec.message()));
      }
    }
    state->watches.push_back(&watch);
    watch.Slot() = state;
    Arm(state);
    return expected<void, Error>::success();
  }

  void RemoveWatch(Watch& watch) override {
    auto state = std::static_pointer_cast<FdState>(watch.Slot());
    if (state == nullptr) return;
    watch.Slot().reset();
    auto& ws = state->watches;
    ws.erase(std::remove(ws.begin(), ws.end(), &watch), ws.end());
    if (ws.empty()) {
      // The fd belongs to libdbus; hand it back before it is closed.
      const int32_t fd = state->descriptor.native_handle();
      state->Shutdown();
      fds_.erase(fd);
    } else {
      Arm(state);
    }
  }

  void WatchToggled(Watch& watch) override {
    auto state = std::static_pointer_cast<FdState>(watch.Slot());
    if (state != nullptr) Arm(state);
  }

  expected<void, Error> AddTimeout(Timeout& timeout) override {
    auto state = std::make_shared<TimerState>(io_, &timeout);
    timeout.Slot() = state;
    timers_[&timeout] = state;
    if (timeout.Enabled()) ArmTimer(state);
    return expected<void, Error>::success();
  }

  void RemoveTimeout(Timeout& timeout) override {
    auto state = std::static_pointer_cast<TimerState>(timeout.Slot());
    if (state == nullptr) return;
    timeout.Slot().reset();
    state->Shutdown();
    timers_.erase(&timeout);
  }

  void TimeoutToggled(Timeout& timeout) override {
    auto state = std::static_pointer_cast<TimerState>(timeout.Slot());
    if (state == nullptr) return;
    if (!timeout.Enabled()) {
      state->armed = false;
      ++state->generation;
      state->timer.cancel();
      return;
    }
    if (!state->armed || state->interval_ms != timeout.IntervalMs()) {
      ArmTimer(state);
    }
  }

  void AttachConnection(Connection& conn) override {
    auto& slot = attached_[&conn];
    if (slot == nullptr) slot = std::make_shared<Attachment>(&conn);
  }

  void DetachConnection(Connection& conn) override {
    auto it = attached_.find(&conn);
    if (it == attached_.end()) return;
    it->second->conn = nullptr;
    attached_.erase(it);
  }

  void Wakeup(Connection& conn) override {
    Connection* c = &conn;
    boost::asio::post(io_, [this, c] { ScheduleDispatch(c); });
  }

  // --- Calls ---

  /**
   * @brief Send a method call; the reply completes @p token.
   *
   * The completion handler is always invoked through its associated
   * executor, never from inside a dispatch pass.
   */
  template <typename CompletionToken>
  auto AsyncCall(Connection& conn, const CallRequest& request,
                 int32_t timeout_ms, CompletionToken&& token) {
    return boost::asio::async_initiate<CompletionToken, CallSignature>(
        [this, &conn, request, timeout_ms](auto handler) {
          using HandlerType = std::decay_t<decltype(handler)>;
          auto shared = std::make_shared<HandlerType>(std::move(handler));
          auto complete = [this, shared](boost::system::error_code ec,
                                         Message reply) {
            auto ex = boost::asio::get_associated_executor(*shared,
                                                           io_.get_executor());
            boost::asio::post(ex, [shared, ec, reply]() mutable {
              (*shared)(ec, std::move(reply));
            });
          };
          auto serial = conn.CallMethod(
              request,
              [complete](Message reply) {
                complete(boost::system::error_code(), std::move(reply));
              },
              timeout_ms);
          if (!serial) {
            const Error& e = serial.get_error();
            complete(boost::system::errc::make_error_code(
                         boost::system::errc::io_error),
                     Message::LocalError(e.name, e.message, 0U));
          }
        },
        token);
  }

  /** @brief Suspend the fiber behind @p yield until the reply arrives. */
  template <typename Handler>
  expected<ValueList, Error> Call(Connection& conn, const CallRequest& request,
                                  int32_t timeout_ms,
                                  boost::asio::basic_yield_context<Handler> yield) {
    FiberScope scope(CurrentFiber());
    // Nothing runs as this fiber while it is suspended.
    CurrentFiber() = nullptr;
    boost::system::error_code ec;
    Message reply = AsyncCall(conn, request, timeout_ms, yield[ec]);
    if (ec && !reply.IsValid()) {
      return expected<ValueList, Error>::error(
          Error(errors::kIoError, ec.message()));
    }
    return ReplyToResult(reply);
  }

  /** @brief Call from a handler running under FiberSpawner(). */
  expected<ValueList, Error> Call(Connection& conn, const CallRequest& request,
                                  int32_t timeout_ms = -1) {
    const boost::asio::yield_context* fiber = CurrentFiber();
    if (fiber == nullptr) {
      return expected<ValueList, Error>::error(
          Error(errors::kFailed,
                "not running in a fiber; install FiberSpawner() on the "
                "connection"));
    }
    return Call(conn, request, timeout_ms, *fiber);
  }

  /** @brief Spawner running each handler invocation in its own fiber. */
  Connection::Spawner FiberSpawner() {
    return [this](Connection::Task task) {
      FiberScope scope(CurrentFiber());
      boost::asio::spawn(io_, [task](boost::asio::yield_context yield) {
        CurrentFiber() = &yield;
        task();
        CurrentFiber() = nullptr;
      });
    };
  }

  size_t DescriptorCount() const noexcept { return fds_.size(); }
  size_t TimerCount() const noexcept { return timers_.size(); }

 private:
  struct FdState {
    explicit FdState(boost::asio::io_context& io) : descriptor(io) {}
    ~FdState() { Shutdown(); }

    void Shutdown() {
      closed = true;
      if (descriptor.is_open()) {
        boost::system::error_code ec;
        descriptor.cancel(ec);
        (void)descriptor.release();
      }
    }

    boost::asio::posix::stream_descriptor descriptor;
    std::vector<Watch*> watches;
    bool read_pending = false;
    bool write_pending = false;
    bool closed = false;
  };

  struct TimerState {
    TimerState(boost::asio::io_context& io, Timeout* t) : timer(io), timeout(t) {}

    void Shutdown() {
      active = false;
      armed = false;
      ++generation;
      timer.cancel();
    }

    boost::asio::steady_timer timer;
    Timeout* timeout;
    int32_t interval_ms = 0;
    uint64_t generation = 0U;
    std::chrono::steady_clock::time_point expiry;
    bool armed = false;
    bool active = true;
  };

  struct Attachment {
    explicit Attachment(Connection* c) noexcept : conn(c) {}
    Connection* conn;
    bool scheduled = false;
  };

  /// Restores the enclosing fiber after a suspension or a nested spawn.
  class FiberScope {
   public:
    explicit FiberScope(const boost::asio::yield_context* saved) noexcept
        : saved_(saved) {}
    ~FiberScope() { CurrentFiber() = saved_; }
    FiberScope(const FiberScope&) = delete;
    FiberScope& operator=(const FiberScope&) = delete;

   private:
    const boost::asio::yield_context* saved_;
  };

  static const boost::asio::yield_context*& CurrentFiber() {
    static thread_local const boost::asio::yield_context* current = nullptr;
    return current;
  }

  // --- fd readiness ---

  static uint8_t Wanted(const FdState& state) {
    uint8_t mask = 0U;
    for (Watch* w : state.watches) {
      if (w->Enabled()) mask |= w->Flags();
    }
    return mask;
  }

  void Arm(const std::shared_ptr<FdState>& state) {
    if (state->closed) return;
    const uint8_t wanted = Wanted(*state);
    const bool want_read = HasEvent(wanted, IoEvent::kReadable);
    const bool want_write = HasEvent(wanted, IoEvent::kWritable);

    if ((state->read_pending && !want_read) ||
        (state->write_pending && !want_write)) {
      // Aborted handlers re-arm whatever is still wanted.
      boost::system::error_code ec;
      state->descriptor.cancel(ec);
      return;
    }
    if (want_read && !state->read_pending) {
      state->read_pending = true;
      state->descriptor.async_wait(
          boost::asio::posix::stream_descriptor::wait_read,
          [this, state](const boost::system::error_code& ec) {
            state->read_pending = false;
            OnReady(state, ec, IoEvent::kReadable);
          });
    }
    if (want_write && !state->write_pending) {
      state->write_pending = true;
      state->descriptor.async_wait(
          boost::asio::posix::stream_descriptor::wait_write,
          [this, state](const boost::system::error_code& ec) {
            state->write_pending = false;
            OnReady(state, ec, IoEvent::kWritable);
          });
    }
  }

  void OnReady(const std::shared_ptr<FdState>& state,
               const boost::system::error_code& ec, IoEvent event) {
    if (state->closed) return;
    if (ec == boost::asio::error::operation_aborted) {
      Arm(state);
      return;
    }
    const uint8_t events = static_cast<uint8_t>(ec ? IoEvent::kError : event);
    if (ec) {
      EBUS_LOG_WARN("asio", "wait on fd %d failed: %s",
                    state->descriptor.native_handle(), ec.message().c_str());
    }

    std::vector<Watch*> snapshot = state->watches;
    std::vector<Connection*> owners;
    for (Watch* w : snapshot) {
      // Handling one watch may remove another.
      const auto& live = state->watches;
      if (std::find(live.begin(), live.end(), w) == live.end()) continue;
      if (!w->Enabled()) continue;
      if (!ec && (w->Flags() & static_cast<uint8_t>(event)) == 0U) continue;
      Connection* owner = w->Owner();
      w->Handle(events);
      if (owner != nullptr) owners.push_back(owner);
    }
    Arm(state);
    for (Connection* c : owners) ScheduleDispatch(c);
  }

  // --- timers ---

  static std::chrono::milliseconds Period(const TimerState& state) {
    return std::chrono::milliseconds(std::max<int32_t>(state.interval_ms, 1));
  }

  void ArmTimer(const std::shared_ptr<TimerState>& state) {
    state->interval_ms = state->timeout->IntervalMs();
    state->armed = true;
    const uint64_t generation = ++state->generation;
    state->expiry = std::chrono::steady_clock::now() + Period(*state);
    state->timer.expires_at(state->expiry);
    WaitTimer(state, generation);
  }

  void WaitTimer(const std::shared_ptr<TimerState>& state,
                 uint64_t generation) {
    state->timer.async_wait(
        [this, state, generation](const boost::system::error_code& ec) {
          if (ec == boost::asio::error::operation_aborted) return;
          if (!state->active || !state->armed ||
              generation != state->generation) {
            return;
          }
          const auto now = std::chrono::steady_clock::now();
          const auto period = Period(*state);
          auto next = state->expiry + period;
          if (next <= now) {
            next += ((now - next) / period + 1) * period;
          }
          state->expiry = next;
          state->timer.expires_at(next);
          WaitTimer(state, generation);

          Connection* owner = state->timeout->Owner();
          state->timeout->Handle();
          if (owner != nullptr) ScheduleDispatch(owner);
        });
  }

  // --- dispatch ---

  void ScheduleDispatch(Connection* conn) {
    auto it = attached_.find(conn);
    if (it == attached_.end() || it->second->scheduled) return;
    std::shared_ptr<Attachment> attachment = it->second;
    attachment->scheduled = true;
    boost::asio::post(io_, [attachment] {
      attachment->scheduled = false;
      if (attachment->conn != nullptr) (void)DrainDispatch(*attachment->conn);
    });
  }

  boost::asio::io_context& io_;
  std::unordered_map<int32_t, std::shared_ptr<FdState>> fds_;
  std::unordered_map<Timeout*, std::shared_ptr<TimerState>> timers_;
  std::unordered_map<Connection*, std::shared_ptr<Attachment>> attached_;
};

}  // namespace ebus

#endif  // EBUS_ASIO_LOOP_HPP_
