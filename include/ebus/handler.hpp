/**
 * @file handler.hpp
 * @brief Handler registry: explicit registration table and router.
 *
 * A Handler is one routing chain. Registrations are keyed by member name;
 * among registrations for the same member, insertion order is candidate
 * order and the first whose interface and path filters accept the message
 * wins.
 *
 * Method handlers get a MethodContext (connection, message, decoded
 * arguments, response setter) and return MethodResult. Each matched method
 * call is answered exactly once:
 *   - success: method return carrying the response;
 *   - Error with a valid name: error reply with that name and text;
 *   - thrown exception or nameless Error: UncaughtException error reply.
 * Calls sent with the no-reply flag are run but never answered. Signal
 * handler failures are logged only.
 *
 * @code
 *   auto h = std::make_shared<ebus::Handler>();
 *   h->Add(ebus::HandlerEntry::Method("Echo", [](ebus::MethodContext& ctx) {
 *            ctx.SetResponse(ctx.Message().Signature(), ctx.Args());
 *            return ebus::MethodResult::success();
 *          }).Interface("org.example.Test"));
 *   conn.AddHandler(h);
 * @endcode
 */

#ifndef EBUS_HANDLER_HPP_
#define EBUS_HANDLER_HPP_

#include "ebus/connection.hpp"
#include "ebus/error.hpp"
#include "ebus/log.hpp"
#include "ebus/message.hpp"
#include "ebus/value.hpp"
#include "ebus/vocabulary.hpp"

#include <fnmatch.h>

#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ebus {

// ============================================================================
// MethodContext
// ============================================================================

/** @brief Per-dispatch state handed to a method handler. */
class MethodContext {
 public:
  MethodContext(Connection& conn, const ebus::Message& msg, ValueList args,
                std::string reply_signature)
      : conn_(conn),
        msg_(msg),
        args_(std::move(args)),
        response_signature_(std::move(reply_signature)) {}

  MethodContext(const MethodContext&) = delete;
  MethodContext& operator=(const MethodContext&) = delete;

  Connection& Conn() const noexcept { return conn_; }
  const ebus::Message& Message() const noexcept { return msg_; }
  const ValueList& Args() const noexcept { return args_; }

  /** @brief Set the response using the registration's reply signature. */
  void SetResponse(ValueList args) { response_ = std::move(args); }

  void SetResponse(std::string signature, ValueList args) {
    response_signature_ = std::move(signature);
    response_ = std::move(args);
  }

  const std::string& ResponseSignature() const noexcept {
    return response_signature_;
  }
  const ValueList& Response() const noexcept { return response_; }

 private:
  Connection& conn_;
  const ebus::Message& msg_;
  ValueList args_;
  std::string response_signature_;
  ValueList response_;
};

using MethodResult = expected<void, Error>;
using MethodFn = std::function<MethodResult(MethodContext&)>;
using SignalFn = std::function<void(Connection&, const Message&)>;

// ============================================================================
// HandlerEntry
// ============================================================================

enum class HandlerKind : uint8_t { kMethod, kSignal };

/** @brief One registration; configure before adding it to a Handler. */
class HandlerEntry {
 public:
  static HandlerEntry Method(std::string member, MethodFn fn) {
    HandlerEntry e(HandlerKind::kMethod, std::move(member));
    e.method_ = std::move(fn);
    return e;
  }

  static HandlerEntry Signal(std::string member, SignalFn fn) {
    HandlerEntry e(HandlerKind::kSignal, std::move(member));
    e.signal_ = std::move(fn);
    return e;
  }

  /** @brief Only accept messages for this interface (exact match). */
  HandlerEntry& Interface(std::string interface) {
    interface_ = std::move(interface);
    return *this;
  }

  /** @brief Only accept paths matching this fnmatch(3) glob. */
  HandlerEntry& Path(std::string pattern) {
    path_ = std::move(pattern);
    return *this;
  }

  /** @brief Signature of the response set with SetResponse(args). */
  HandlerEntry& ReplySignature(std::string signature) {
    reply_signature_ = std::move(signature);
    return *this;
  }

  HandlerKind Kind() const noexcept { return kind_; }
  const std::string& Member() const noexcept { return member_; }
  const std::string& InterfaceFilter() const noexcept { return interface_; }
  const std::string& PathPattern() const noexcept { return path_; }

  /** @brief Interface and path filters; member and kind are matched by key. */
  bool Accepts(const ebus::Message& msg) const {
    if (!interface_.empty() && interface_ != msg.Interface()) return false;
    if (!path_.empty() && !PathMatches(path_, msg.Path())) return false;
    return true;
  }

  static bool PathMatches(const std::string& pattern, const std::string& path) {
    return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
  }

 private:
  friend class Handler;

  HandlerEntry(HandlerKind kind, std::string member)
      : kind_(kind), member_(std::move(member)) {}

  HandlerKind kind_;
  std::string member_;
  std::string interface_;
  std::string path_;
  std::string reply_signature_;
  MethodFn method_;
  SignalFn signal_;
};

// ============================================================================
// Handler
// ============================================================================

class Handler : public MessageRouter {
 public:
  Handler() = default;

  Handler(const Handler&) = delete;
  Handler& operator=(const Handler&) = delete;

  void Add(HandlerEntry entry) {
    auto shared = std::make_shared<const HandlerEntry>(std::move(entry));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& table =
        (shared->Kind() == HandlerKind::kMethod) ? methods_ : signals_;
    table[shared->Member()].push_back(std::move(shared));
  }

  void AddMethod(std::string member, MethodFn fn,
                 std::string reply_signature = "") {
    Add(HandlerEntry::Method(std::move(member), std::move(fn))
            .ReplySignature(std::move(reply_signature)));
  }

  void AddSignal(std::string member, SignalFn fn) {
    Add(HandlerEntry::Signal(std::move(member), std::move(fn)));
  }

  /** @brief Drop every registration for @p member of @p kind. */
  size_t Remove(HandlerKind kind, const std::string& member) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& table = (kind == HandlerKind::kMethod) ? methods_ : signals_;
    auto it = table.find(member);
    if (it == table.end()) return 0U;
    const size_t n = it->second.size();
    table.erase(it);
    return n;
  }

  /** @brief First registration accepting @p msg, or nullptr. */
  std::shared_ptr<const HandlerEntry> Match(const ebus::Message& msg) const {
    const MessageType type = msg.Type();
    if (type != MessageType::kMethodCall && type != MessageType::kSignal) {
      return nullptr;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto& table = (type == MessageType::kMethodCall) ? methods_ : signals_;
    auto it = table.find(msg.Member());
    if (it == table.end()) return nullptr;
    for (const auto& entry : it->second) {
      if (entry->Accepts(msg)) return entry;
    }
    return nullptr;
  }

  std::function<void()> Route(Connection& conn,
                              const ebus::Message& msg) override {
    auto entry = Match(msg);
    if (entry == nullptr) return {};
    return [entry, &conn, msg]() { Invoke(*entry, conn, msg); };
  }

  /** @brief Match and invoke inline. @return Whether anything matched. */
  bool Dispatch(Connection& conn, const ebus::Message& msg) {
    auto entry = Match(msg);
    if (entry == nullptr) return false;
    Invoke(*entry, conn, msg);
    return true;
  }

  static void Invoke(const HandlerEntry& entry, Connection& conn,
                     const ebus::Message& msg) {
    if (entry.Kind() == HandlerKind::kSignal) {
      InvokeSignal(entry, conn, msg);
    } else {
      InvokeMethod(entry, conn, msg);
    }
  }

 private:
  using Table =
      std::unordered_map<std::string,
                         std::vector<std::shared_ptr<const HandlerEntry>>>;

  static void InvokeSignal(const HandlerEntry& entry, Connection& conn,
                           const ebus::Message& msg) {
    try {
      entry.signal_(conn, msg);
    } catch (const std::exception& e) {
      EBUS_LOG_ERROR("router", "signal handler %s at %s raised: %s",
                     entry.Member().c_str(), msg.Path().c_str(), e.what());
    } catch (...) {
      EBUS_LOG_ERROR("router", "signal handler %s at %s raised a non-standard "
                     "exception", entry.Member().c_str(), msg.Path().c_str());
    }
  }

  static void InvokeMethod(const HandlerEntry& entry, Connection& conn,
                           const ebus::Message& msg) {
    MethodContext ctx(conn, msg, msg.Args(), entry.reply_signature_);
    MethodResult result = MethodResult::success();
    bool uncaught = false;
    try {
      result = entry.method_(ctx);
    } catch (const std::exception& e) {
      EBUS_LOG_ERROR("router", "method %s at %s raised: %s",
                     entry.Member().c_str(), msg.Path().c_str(), e.what());
      uncaught = true;
    } catch (...) {
      EBUS_LOG_ERROR("router", "method %s at %s raised a non-standard "
                     "exception", entry.Member().c_str(), msg.Path().c_str());
      uncaught = true;
    }

    if (msg.NoReply()) return;

    expected<uint32_t, Error> sent = expected<uint32_t, Error>::success(0U);
    if (uncaught) {
      sent = conn.SendError(msg, errors::kUncaughtException,
                            "uncaught exception in " + entry.Member());
    } else if (result.has_value()) {
      sent = conn.SendMethodReturn(msg, ctx.ResponseSignature(),
                                   ctx.Response());
      if (!sent && sent.get_error().name != errors::kNoMemory &&
          sent.get_error().name != errors::kDisconnected) {
        EBUS_LOG_ERROR("router", "bad response from %s: %s",
                       entry.Member().c_str(),
                       sent.get_error().message.c_str());
        sent = conn.SendError(msg, errors::kInvalidArgs,
                              sent.get_error().message);
      }
    } else {
      const Error& err = result.get_error();
      if (dbus_validate_error_name(err.name.c_str(), nullptr) != FALSE) {
        sent = conn.SendError(msg, err.name, err.message);
      } else {
        EBUS_LOG_ERROR("router", "method %s failed without an error name: %s",
                       entry.Member().c_str(), err.message.c_str());
        sent = conn.SendError(msg, errors::kUncaughtException, err.message);
      }
    }
    if (!sent) {
      EBUS_LOG_WARN("router", "reply to %s not sent: %s",
                    entry.Member().c_str(), sent.get_error().message.c_str());
    }
  }

  mutable std::shared_mutex mutex_;
  Table methods_;
  Table signals_;
};

}  // namespace ebus

#endif  // EBUS_HANDLER_HPP_
