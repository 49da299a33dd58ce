/**
 * @file server.hpp
 * @brief Peer-to-peer listener: accepts direct connections on an address.
 *
 * Each accepted peer becomes a Connection bound to the server's EventLoop
 * and owned by the Server. The on_connection callback sees it before it is
 * installed on the loop, so handlers and a spawner attached there are in
 * place before the first message is dispatched.
 */

#ifndef EBUS_SERVER_HPP_
#define EBUS_SERVER_HPP_

#include "ebus/connection.hpp"
#include "ebus/error.hpp"
#include "ebus/event_loop.hpp"
#include "ebus/log.hpp"
#include "ebus/vocabulary.hpp"

#include <dbus/dbus.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ebus {

class Server {
 public:
  using ConnectionFn = std::function<void(Connection&)>;

  explicit Server(EventLoop& loop) noexcept
      : loop_(loop), binding_{&loop, nullptr} {}

  ~Server() { Disconnect(); }

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * @brief Start listening on @p address (e.g. "unix:tmpdir=/tmp").
   * @param on_connection Called once per accepted peer.
   */
  expected<void, Error> Listen(const std::string& address,
                               ConnectionFn on_connection = nullptr) {
    if (raw_ != nullptr) {
      return expected<void, Error>::error(
          Error(errors::kFailed, "server already listening"));
    }
    if (!detail::InitThreads()) {
      return expected<void, Error>::error(NoMemoryError());
    }
    ScopedDBusError err;
    DBusServer* raw = dbus_server_listen(address.c_str(), err.get());
    if (raw == nullptr) {
      Error e = err.ToError(errors::kIoError);
      EBUS_LOG_ERROR("server", "listen %s failed: %s", address.c_str(),
                     e.message.c_str());
      return expected<void, Error>::error(std::move(e));
    }
    raw_ = raw;
    on_connection_ = std::move(on_connection);

    dbus_server_set_new_connection_function(raw_, &Server::NewConnectionThunk,
                                            this, nullptr);
    if (dbus_server_set_watch_functions(
            raw_, &detail::AddWatchThunk, &detail::RemoveWatchThunk,
            &detail::WatchToggledThunk, &binding_, nullptr) == FALSE ||
        dbus_server_set_timeout_functions(
            raw_, &detail::AddTimeoutThunk, &detail::RemoveTimeoutThunk,
            &detail::TimeoutToggledThunk, &binding_, nullptr) == FALSE) {
      Disconnect();
      return expected<void, Error>::error(NoMemoryError());
    }
    EBUS_LOG_INFO("server", "listening on %s", Address().c_str());
    return expected<void, Error>::success();
  }

  /** @brief Address peers connect to (with the resolved socket path). */
  std::string Address() const {
    if (raw_ == nullptr) return std::string();
    char* addr = dbus_server_get_address(raw_);
    if (addr == nullptr) return std::string();
    std::string out(addr);
    dbus_free(addr);
    return out;
  }

  /** @brief Stop listening and close every accepted connection. */
  void Disconnect() {
    if (raw_ != nullptr) {
      dbus_server_disconnect(raw_);
      (void)dbus_server_set_watch_functions(raw_, nullptr, nullptr, nullptr,
                                            nullptr, nullptr);
      (void)dbus_server_set_timeout_functions(raw_, nullptr, nullptr, nullptr,
                                              nullptr, nullptr);
      dbus_server_set_new_connection_function(raw_, nullptr, nullptr, nullptr);
      dbus_server_unref(raw_);
      raw_ = nullptr;
    }
    std::vector<std::unique_ptr<Connection>> conns;
    conns.swap(connections_);
    for (auto& c : conns) c->Close();
  }

  bool IsListening() const noexcept { return raw_ != nullptr; }

  /** @brief Accepted connections whose peer is still connected. */
  size_t ConnectionCount() const noexcept {
    return static_cast<size_t>(std::count_if(
        connections_.begin(), connections_.end(),
        [](const std::unique_ptr<Connection>& c) { return c->IsConnected(); }));
  }

 private:
  void Accept(DBusConnection* raw) {
    PruneDisconnected();
    auto conn = std::make_unique<Connection>(loop_);
    conn->Adopt(raw);
    if (on_connection_) on_connection_(*conn);
    auto r = conn->Install();
    if (!r) {
      EBUS_LOG_ERROR("server", "install accepted connection: %s",
                     r.get_error().message.c_str());
      conn->Close();
      return;
    }
    EBUS_LOG_DEBUG("server", "accepted peer (%zu open)",
                   connections_.size() + 1U);
    connections_.push_back(std::move(conn));
  }

  void PruneDisconnected() {
    auto it = std::stable_partition(
        connections_.begin(), connections_.end(),
        [](const std::unique_ptr<Connection>& c) { return c->IsConnected(); });
    for (auto i = it; i != connections_.end(); ++i) (*i)->Close();
    connections_.erase(it, connections_.end());
  }

  static void NewConnectionThunk(DBusServer* /*server*/, DBusConnection* raw,
                                 void* data) {
    static_cast<Server*>(data)->Accept(raw);
  }

  EventLoop& loop_;
  detail::LoopBinding binding_;
  DBusServer* raw_ = nullptr;
  ConnectionFn on_connection_;
  std::vector<std::unique_ptr<Connection>> connections_;
};

}  // namespace ebus

#endif  // EBUS_SERVER_HPP_
