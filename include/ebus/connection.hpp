/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file connection.hpp
 * @brief Bus connection: lifecycle, sending, pending calls and routing.
 *
 * A Connection wraps one private libdbus connection and binds it to an
 * EventLoop given at construction. Inbound method calls and signals pass
 * through a single libdbus filter which offers them to the attached routers
 * (see handler.hpp):
 *   - a method call goes to the first router that matches it;
 *   - a signal goes to every router that matches it.
 * Matching runs inside the dispatch pass; the matched work item is handed to
 * the spawner (inline by default).
 *
 * Outgoing calls with a reply callback are tracked in a pending table keyed
 * by serial. Whichever outcome removes the entry first (reply, libdbus
 * timeout, Close()) is the only one delivered to the callback.
 */

#ifndef EBUS_CONNECTION_HPP_
#define EBUS_CONNECTION_HPP_

#include "ebus/call.hpp"
#include "ebus/error.hpp"
#include "ebus/event_loop.hpp"
#include "ebus/log.hpp"
#include "ebus/message.hpp"
#include "ebus/vocabulary.hpp"

#include <dbus/dbus.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ebus {

class Connection;
class Server;

// ============================================================================
// Enums
// ============================================================================

enum class OpenMode : uint8_t {
  kBus = 0,  ///< Register with the bus daemon and obtain a unique name.
  kPeer,     ///< Direct peer-to-peer connection, no registration.
};

enum class DispatchStatus : uint8_t {
  kDataRemains = 0,
  kComplete,
  kNeedMemory,
};

// ============================================================================
// MessageRouter
// ============================================================================

/** @brief Routing hook attached to a Connection; Handler is the stock one. */
class MessageRouter {
 public:
  virtual ~MessageRouter() = default;

  /**
   * @brief Bind @p msg to a matching registration.
   * @return Work item running the handler, or an empty function on no match.
   */
  virtual std::function<void()> Route(Connection& conn, const Message& msg) = 0;
};

namespace detail {

inline bool InitThreads() {
  static const bool ok = dbus_threads_init_default() != FALSE;
  return ok;
}

}  // namespace detail

// ============================================================================
// Connection
// ============================================================================

class Connection {
 public:
  using Task = std::function<void()>;
  /** @brief Runs (or schedules) one handler invocation. */
  using Spawner = std::function<void(Task)>;

  explicit Connection(EventLoop& loop) noexcept
      : loop_(loop), binding_{&loop, this} {}

  ~Connection() { Close(); }

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- Lifecycle ---

  /**
   * @brief Connect to @p address.
   *
   * "session" and "system" name the well-known buses (always registered);
   * anything else is a libdbus address such as "unix:path=/run/x".
   */
  expected<void, Error> Open(const std::string& address,
                             OpenMode mode = OpenMode::kBus) {
    if (raw_ != nullptr) {
      return expected<void, Error>::error(
          Error(errors::kFailed, "connection already open"));
    }
    if (!detail::InitThreads()) {
      return expected<void, Error>::error(NoMemoryError());
    }

    ScopedDBusError err;
    DBusConnection* raw = nullptr;
    if (address == "session" || address == "system") {
      raw = dbus_bus_get_private(
          address == "system" ? DBUS_BUS_SYSTEM : DBUS_BUS_SESSION, err.get());
    } else {
      raw = dbus_connection_open_private(address.c_str(), err.get());
      if (raw != nullptr && mode == OpenMode::kBus &&
          dbus_bus_register(raw, err.get()) == FALSE) {
        dbus_connection_close(raw);
        dbus_connection_unref(raw);
        raw = nullptr;
      }
    }
    if (raw == nullptr) {
      Error e = err.ToError(errors::kIoError);
      EBUS_LOG_ERROR("conn", "open %s failed: %s: %s", address.c_str(),
                     e.name.c_str(), e.message.c_str());
      return expected<void, Error>::error(std::move(e));
    }

    dbus_connection_set_exit_on_disconnect(raw, FALSE);
    raw_ = raw;
    const char* unique = dbus_bus_get_unique_name(raw_);
    unique_name_ = (unique != nullptr) ? unique : "";

    auto r = Install();
    if (!r) {
      Close();
      return r;
    }
    EBUS_LOG_INFO("conn", "opened %s %s", address.c_str(),
                  unique_name_.c_str());
    return expected<void, Error>::success();
  }

  /**
   * @brief Disconnect and release the libdbus connection.
   *
   * Outstanding reply callbacks each receive a local Disconnected error.
   * The connection may be opened again afterwards.
   */
  void Close() {
    if (raw_ == nullptr) return;

    loop_.DetachConnection(*this);

    std::unordered_map<uint32_t, PendingCall> cancelled;
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      cancelled.swap(pending_);
    }
    for (auto& kv : cancelled) {
      dbus_pending_call_cancel(kv.second.pending);
      dbus_pending_call_unref(kv.second.pending);
    }

    if (filter_added_) {
      dbus_connection_remove_filter(raw_, &Connection::FilterThunk, this);
      filter_added_ = false;
    }
    dbus_connection_close(raw_);
    dbus_connection_set_dispatch_status_function(raw_, nullptr, nullptr,
                                                 nullptr);
    (void)dbus_connection_set_watch_functions(raw_, nullptr, nullptr, nullptr,
                                              nullptr, nullptr);
    (void)dbus_connection_set_timeout_functions(raw_, nullptr, nullptr,
                                                nullptr, nullptr, nullptr);
    dbus_connection_unref(raw_);
    raw_ = nullptr;
    unique_name_.clear();
    EBUS_LOG_INFO("conn", "closed (%zu pending calls cancelled)",
                  cancelled.size());

    for (auto& kv : cancelled) {
      kv.second.callback(Message::LocalError(
          errors::kDisconnected, "connection closed before reply", kv.first));
    }
  }

  bool IsOpen() const noexcept { return raw_ != nullptr; }

  /** @brief False once the transport is gone (peer hung up). */
  bool IsConnected() const noexcept {
    return raw_ != nullptr && dbus_connection_get_is_connected(raw_) != FALSE;
  }

  /** @brief Bus-assigned name (":1.42"); empty for peer connections. */
  const std::string& UniqueName() const noexcept { return unique_name_; }

  EventLoop& Loop() noexcept { return loop_; }
  DBusConnection* raw() const noexcept { return raw_; }

  // --- Transport primitives ---

  /** @brief Queue @p msg for sending. @return Assigned serial. */
  expected<uint32_t, Error> Send(const Message& msg) {
    if (raw_ == nullptr) {
      return expected<uint32_t, Error>::error(NotOpenError());
    }
    dbus_uint32_t serial = 0;
    if (dbus_connection_send(raw_, msg.raw(), &serial) == FALSE) {
      return expected<uint32_t, Error>::error(NoMemoryError());
    }
    return expected<uint32_t, Error>::success(serial);
  }

  DispatchStatus GetDispatchStatus() const noexcept {
    if (raw_ == nullptr) return DispatchStatus::kComplete;
    return ToStatus(dbus_connection_get_dispatch_status(raw_));
  }

  /**
   * @brief Dispatch one queued message.
   *
   * Refuses (returns kComplete) when called from inside a dispatch of this
   * connection on the same thread, which libdbus would deadlock on.
   */
  DispatchStatus DispatchOne() {
    if (raw_ == nullptr) return DispatchStatus::kComplete;
    if (IsDispatchingOnThisThread()) {
      EBUS_LOG_DEBUG("conn", "nested dispatch skipped");
      return DispatchStatus::kComplete;
    }
    auto& active = ActiveDispatches();
    active.push_back(this);
    const DBusDispatchStatus status = dbus_connection_dispatch(raw_);
    active.pop_back();
    return ToStatus(status);
  }

  bool IsDispatchingOnThisThread() const {
    const auto& active = ActiveDispatches();
    return std::find(active.begin(), active.end(), this) != active.end();
  }

  /** @brief Block until the outgoing queue is written. */
  void Flush() {
    if (raw_ != nullptr) dbus_connection_flush(raw_);
  }

  // --- Routing ---

  void AddHandler(std::shared_ptr<MessageRouter> router) {
    EBUS_ASSERT(router != nullptr);
    std::lock_guard<std::mutex> lock(routing_mutex_);
    routers_.push_back(std::move(router));
  }

  bool RemoveHandler(const std::shared_ptr<MessageRouter>& router) {
    std::lock_guard<std::mutex> lock(routing_mutex_);
    auto it = std::find(routers_.begin(), routers_.end(), router);
    if (it == routers_.end()) return false;
    routers_.erase(it);
    return true;
  }

  /** @brief Replace the spawner; an empty one runs handlers inline. */
  void SetSpawner(Spawner spawner) {
    std::lock_guard<std::mutex> lock(routing_mutex_);
    spawner_ = std::move(spawner);
  }

  // --- Replies and signals ---

  expected<uint32_t, Error> SendMethodReturn(const Message& call,
                                             const std::string& signature = "",
                                             const ValueList& args = {}) {
    auto reply = Message::MethodReturn(call);
    if (!reply) return expected<uint32_t, Error>::error(reply.get_error());
    auto r = reply.value().SetArgs(signature, args);
    if (!r) return expected<uint32_t, Error>::error(r.get_error());
    return Send(reply.value());
  }

  expected<uint32_t, Error> SendError(const Message& call,
                                      const std::string& name,
                                      const std::string& text = "") {
    auto reply = Message::ErrorReply(call, name, text);
    if (!reply) return expected<uint32_t, Error>::error(reply.get_error());
    return Send(reply.value());
  }

  /** @brief Error reply carrying a typed payload instead of a text. */
  expected<uint32_t, Error> SendError(const Message& call,
                                      const std::string& name,
                                      const std::string& signature,
                                      const ValueList& args) {
    auto reply = Message::ErrorReply(call, name, "");
    if (!reply) return expected<uint32_t, Error>::error(reply.get_error());
    auto r = reply.value().SetArgs(signature, args);
    if (!r) return expected<uint32_t, Error>::error(r.get_error());
    return Send(reply.value());
  }

  /**
   * @brief Emit a signal.
   *
   * @p member may be qualified ("org.example.Iface.Changed") when
   * @p interface is empty; a signal without an interface is rejected.
   */
  expected<uint32_t, Error> SendSignal(const std::string& path,
                                       const std::string& member,
                                       const std::string& signature = "",
                                       const ValueList& args = {},
                                       const std::string& interface = "",
                                       const std::string& destination = "") {
    std::string iface = interface;
    std::string name;
    SplitMember(member, iface, name);
    if (iface.empty()) {
      return expected<uint32_t, Error>::error(Error(
          errors::kInvalidArgs, "signal '" + member + "' needs an interface"));
    }
    auto msg = Message::Signal(path, iface, name);
    if (!msg) return expected<uint32_t, Error>::error(msg.get_error());
    if (!destination.empty()) {
      auto valid = detail::ValidateName(detail::NameKind::kBusName, destination);
      if (!valid) return expected<uint32_t, Error>::error(valid.get_error());
      if (!msg.value().SetDestination(destination)) {
        return expected<uint32_t, Error>::error(NoMemoryError());
      }
    }
    auto r = msg.value().SetArgs(signature, args);
    if (!r) return expected<uint32_t, Error>::error(r.get_error());
    return Send(msg.value());
  }

  // --- Calls ---

  /**
   * @brief Issue a method call.
   *
   * Without @p on_reply the call is sent with the no-reply flag. Otherwise
   * @p on_reply runs exactly once, from a dispatch pass, with the reply, the
   * NoReply timeout error, or a local Disconnected error if Close() comes
   * first.
   *
   * @param timeout_ms  -1 for the libdbus default.
   * @return Serial of the sent call.
   */
  expected<uint32_t, Error> CallMethod(const CallRequest& request,
                                       ReplyCallback on_reply = nullptr,
                                       int32_t timeout_ms = -1) {
    if (raw_ == nullptr) {
      return expected<uint32_t, Error>::error(NotOpenError());
    }
    std::string interface = request.interface;
    std::string member;
    SplitMember(request.member, interface, member);

    auto msg =
        Message::MethodCall(request.destination, request.path, interface, member);
    if (!msg) return expected<uint32_t, Error>::error(msg.get_error());
    auto args = msg.value().SetArgs(request.signature, request.args);
    if (!args) return expected<uint32_t, Error>::error(args.get_error());

    if (!on_reply) {
      msg.value().SetNoReply(true);
      return Send(msg.value());
    }

    DBusPendingCall* pending = nullptr;
    if (dbus_connection_send_with_reply(raw_, msg.value().raw(), &pending,
                                        timeout_ms) == FALSE) {
      return expected<uint32_t, Error>::error(NoMemoryError());
    }
    if (pending == nullptr) {
      return expected<uint32_t, Error>::error(
          Error(errors::kDisconnected, "connection is disconnected"));
    }
    const uint32_t serial = msg.value().Serial();
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      pending_.emplace(serial, PendingCall{pending, std::move(on_reply)});
    }

    auto* ctx = new PendingContext{this, serial};
    if (dbus_pending_call_set_notify(pending, &Connection::PendingNotifyThunk,
                                     ctx, &PendingContext::Delete) == FALSE) {
      delete ctx;
      PendingCall entry;
      if (TakePending(serial, entry)) {
        dbus_pending_call_cancel(entry.pending);
        dbus_pending_call_unref(entry.pending);
      }
      return expected<uint32_t, Error>::error(NoMemoryError());
    }
    // The reply may have been processed before the notify was armed.
    if (dbus_pending_call_get_completed(pending) != FALSE) {
      CompletePending(serial);
    }
    return expected<uint32_t, Error>::success(serial);
  }

  /** @brief Forget a pending call without running its callback. */
  bool CancelCall(uint32_t serial) {
    PendingCall entry;
    if (!TakePending(serial, entry)) return false;
    dbus_pending_call_cancel(entry.pending);
    dbus_pending_call_unref(entry.pending);
    return true;
  }

  size_t PendingCount() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
  }

 private:
  friend class Server;

  struct PendingCall {
    DBusPendingCall* pending = nullptr;
    ReplyCallback callback;
  };

  struct PendingContext {
    Connection* conn;
    uint32_t serial;

    static void Delete(void* data) {
      delete static_cast<PendingContext*>(data);
    }
  };

  static DispatchStatus ToStatus(DBusDispatchStatus status) noexcept {
    switch (status) {
      case DBUS_DISPATCH_DATA_REMAINS:
        return DispatchStatus::kDataRemains;
      case DBUS_DISPATCH_NEED_MEMORY:
        return DispatchStatus::kNeedMemory;
      default:
        return DispatchStatus::kComplete;
    }
  }

  static std::vector<const Connection*>& ActiveDispatches() {
    static thread_local std::vector<const Connection*> active;
    return active;
  }

  /** @brief Take ownership of a connection accepted by a Server. */
  void Adopt(DBusConnection* raw) {
    EBUS_ASSERT(raw_ == nullptr);
    dbus_connection_ref(raw);
    dbus_connection_set_exit_on_disconnect(raw, FALSE);
    raw_ = raw;
  }

  expected<void, Error> Install() {
    if (dbus_connection_add_filter(raw_, &Connection::FilterThunk, this,
                                   nullptr) == FALSE) {
      return expected<void, Error>::error(NoMemoryError());
    }
    filter_added_ = true;
    if (dbus_connection_set_watch_functions(
            raw_, &detail::AddWatchThunk, &detail::RemoveWatchThunk,
            &detail::WatchToggledThunk, &binding_, nullptr) == FALSE ||
        dbus_connection_set_timeout_functions(
            raw_, &detail::AddTimeoutThunk, &detail::RemoveTimeoutThunk,
            &detail::TimeoutToggledThunk, &binding_, nullptr) == FALSE) {
      return expected<void, Error>::error(NoMemoryError());
    }
    dbus_connection_set_dispatch_status_function(
        raw_, &Connection::DispatchStatusThunk, this, nullptr);
    loop_.AttachConnection(*this);
    if (GetDispatchStatus() == DispatchStatus::kDataRemains) {
      loop_.Wakeup(*this);
    }
    return expected<void, Error>::success();
  }

  bool TakePending(uint32_t serial, PendingCall& out) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(serial);
    if (it == pending_.end()) return false;
    out = std::move(it->second);
    pending_.erase(it);
    return true;
  }

  void CompletePending(uint32_t serial) {
    PendingCall entry;
    if (!TakePending(serial, entry)) {
      EBUS_LOG_DEBUG("call", "serial %u already resolved", serial);
      return;
    }
    DBusMessage* raw_reply = dbus_pending_call_steal_reply(entry.pending);
    dbus_pending_call_unref(entry.pending);
    Message reply = (raw_reply != nullptr)
                        ? Message::Adopt(raw_reply)
                        : Message::LocalError(errors::kNoReply,
                                              "no reply received", serial);
    if (reply.Type() == MessageType::kError) {
      EBUS_LOG_DEBUG("call", "serial %u failed: %s", serial,
                     reply.ErrorName().c_str());
    }
    entry.callback(std::move(reply));
  }

  void Spawn(Task task) {
    Spawner spawner;
    {
      std::lock_guard<std::mutex> lock(routing_mutex_);
      spawner = spawner_;
    }
    if (spawner) {
      spawner(std::move(task));
    } else {
      task();
    }
  }

  DBusHandlerResult Filter(DBusMessage* raw_msg) {
    Message msg = Message::Ref(raw_msg);
    const MessageType type = msg.Type();

    if (type == MessageType::kMethodReturn || type == MessageType::kError) {
      // Replies with a live pending call never reach filters.
      EBUS_LOG_DEBUG("call", "dropping unexpected reply to serial %u",
                     msg.ReplySerial());
      return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    if (type != MessageType::kMethodCall && type != MessageType::kSignal) {
      return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    if (type == MessageType::kSignal &&
        dbus_message_is_signal(raw_msg, DBUS_INTERFACE_LOCAL, "Disconnected")) {
      EBUS_LOG_INFO("conn", "remote end disconnected");
    }

    std::vector<std::shared_ptr<MessageRouter>> routers;
    {
      std::lock_guard<std::mutex> lock(routing_mutex_);
      routers = routers_;
    }

    bool handled = false;
    for (auto& router : routers) {
      Task task = router->Route(*this, msg);
      if (!task) continue;
      handled = true;
      Spawn(std::move(task));
      if (type == MessageType::kMethodCall) break;
    }
    if (!handled && type == MessageType::kMethodCall) {
      EBUS_LOG_DEBUG("router", "no handler for %s.%s at %s",
                     msg.Interface().c_str(), msg.Member().c_str(),
                     msg.Path().c_str());
    }
    return handled ? DBUS_HANDLER_RESULT_HANDLED
                   : DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
  }

  static DBusHandlerResult FilterThunk(DBusConnection* /*raw*/,
                                       DBusMessage* msg, void* data) {
    return static_cast<Connection*>(data)->Filter(msg);
  }

  static void PendingNotifyThunk(DBusPendingCall* /*pending*/, void* data) {
    auto* ctx = static_cast<PendingContext*>(data);
    ctx->conn->CompletePending(ctx->serial);
  }

  static void DispatchStatusThunk(DBusConnection* /*raw*/,
                                  DBusDispatchStatus status, void* data) {
    if (status == DBUS_DISPATCH_DATA_REMAINS) {
      auto* self = static_cast<Connection*>(data);
      self->loop_.Wakeup(*self);
    }
  }

  EventLoop& loop_;
  detail::LoopBinding binding_;
  DBusConnection* raw_ = nullptr;
  bool filter_added_ = false;
  std::string unique_name_;

  std::mutex routing_mutex_;
  std::vector<std::shared_ptr<MessageRouter>> routers_;
  Spawner spawner_;

  mutable std::mutex pending_mutex_;
  std::unordered_map<uint32_t, PendingCall> pending_;
};

}  // namespace ebus

#endif  // EBUS_CONNECTION_HPP_
