/**
 * @file message.hpp
 * @brief Reference-counted handle to a libdbus message.
 *
 * Factories validate every header name before handing it to libdbus, so
 * malformed input is reported as an Error rather than tripping libdbus
 * argument checks.
 */

#ifndef EBUS_MESSAGE_HPP_
#define EBUS_MESSAGE_HPP_

#include "ebus/error.hpp"
#include "ebus/marshal.hpp"
#include "ebus/value.hpp"
#include "ebus/vocabulary.hpp"

#include <dbus/dbus.h>

#include <cstdint>
#include <string>
#include <utility>

namespace ebus {

// ============================================================================
// MessageType
// ============================================================================

enum class MessageType : uint8_t {
  kInvalid = 0,
  kMethodCall,
  kMethodReturn,
  kError,
  kSignal,
};

inline const char* MessageTypeName(MessageType type) noexcept {
  switch (type) {
    case MessageType::kMethodCall:
      return "method_call";
    case MessageType::kMethodReturn:
      return "method_return";
    case MessageType::kError:
      return "error";
    case MessageType::kSignal:
      return "signal";
    default:
      return "invalid";
  }
}

// ============================================================================
// Name Validation
// ============================================================================

namespace detail {

enum class NameKind : uint8_t {
  kPath,
  kInterface,
  kMember,
  kErrorName,
  kBusName,
};

inline expected<void, Error> ValidateName(NameKind kind,
                                          const std::string& name) {
  ScopedDBusError err;
  dbus_bool_t ok = FALSE;
  const char* what = "";
  switch (kind) {
    case NameKind::kPath:
      ok = dbus_validate_path(name.c_str(), err.get());
      what = "object path";
      break;
    case NameKind::kInterface:
      ok = dbus_validate_interface(name.c_str(), err.get());
      what = "interface";
      break;
    case NameKind::kMember:
      ok = dbus_validate_member(name.c_str(), err.get());
      what = "member";
      break;
    case NameKind::kErrorName:
      ok = dbus_validate_error_name(name.c_str(), err.get());
      what = "error name";
      break;
    case NameKind::kBusName:
      ok = dbus_validate_bus_name(name.c_str(), err.get());
      what = "bus name";
      break;
  }
  if (ok == FALSE) {
    return expected<void, Error>::error(Error(
        errors::kInvalidArgs, std::string("invalid ") + what + " '" + name +
                                  "'"));
  }
  return expected<void, Error>::success();
}

inline std::string CopyHeader(const char* raw) {
  return (raw != nullptr) ? std::string(raw) : std::string();
}

}  // namespace detail

// ============================================================================
// Message
// ============================================================================

class Message {
 public:
  Message() noexcept = default;
  ~Message() { Reset(); }

  Message(const Message& other) noexcept : raw_(other.raw_) {
    if (raw_ != nullptr) dbus_message_ref(raw_);
  }
  Message& operator=(const Message& other) noexcept {
    if (this != &other) {
      Reset();
      raw_ = other.raw_;
      if (raw_ != nullptr) dbus_message_ref(raw_);
    }
    return *this;
  }
  Message(Message&& other) noexcept : raw_(other.raw_) {
    other.raw_ = nullptr;
  }
  Message& operator=(Message&& other) noexcept {
    if (this != &other) {
      Reset();
      raw_ = other.raw_;
      other.raw_ = nullptr;
    }
    return *this;
  }

  /** @brief Takes over one reference already owned by the caller. */
  static Message Adopt(DBusMessage* raw) noexcept {
    Message m;
    m.raw_ = raw;
    return m;
  }

  /** @brief Adds a reference to a message owned elsewhere. */
  static Message Ref(DBusMessage* raw) noexcept {
    Message m;
    m.raw_ = raw;
    if (raw != nullptr) dbus_message_ref(raw);
    return m;
  }

  // --- Factories ---

  /**
   * @brief Creates a method call.
   * @param destination  Bus name, or empty on a peer-to-peer connection.
   * @param interface    May be empty.
   */
  static expected<Message, Error> MethodCall(const std::string& destination,
                                             const std::string& path,
                                             const std::string& interface,
                                             const std::string& member) {
    if (!destination.empty()) {
      auto r = detail::ValidateName(detail::NameKind::kBusName, destination);
      if (!r) return expected<Message, Error>::error(r.get_error());
    }
    auto r = detail::ValidateName(detail::NameKind::kPath, path);
    if (r && !interface.empty()) {
      r = detail::ValidateName(detail::NameKind::kInterface, interface);
    }
    if (r) r = detail::ValidateName(detail::NameKind::kMember, member);
    if (!r) return expected<Message, Error>::error(r.get_error());

    DBusMessage* raw = dbus_message_new_method_call(
        destination.empty() ? nullptr : destination.c_str(), path.c_str(),
        interface.empty() ? nullptr : interface.c_str(), member.c_str());
    return Wrap(raw);
  }

  static expected<Message, Error> MethodReturn(const Message& call) {
    if (call.Type() != MessageType::kMethodCall) {
      return expected<Message, Error>::error(
          Error(errors::kInvalidArgs, "method return requires a method call"));
    }
    return Wrap(dbus_message_new_method_return(call.raw_));
  }

  static expected<Message, Error> ErrorReply(const Message& call,
                                             const std::string& name,
                                             const std::string& text) {
    if (!call.IsValid()) {
      return expected<Message, Error>::error(
          Error(errors::kInvalidArgs, "error reply requires a message"));
    }
    auto r = detail::ValidateName(detail::NameKind::kErrorName, name);
    if (!r) return expected<Message, Error>::error(r.get_error());
    return Wrap(dbus_message_new_error(call.raw_, name.c_str(),
                                       text.empty() ? nullptr : text.c_str()));
  }

  static expected<Message, Error> Signal(const std::string& path,
                                         const std::string& interface,
                                         const std::string& member) {
    auto r = detail::ValidateName(detail::NameKind::kPath, path);
    if (r) r = detail::ValidateName(detail::NameKind::kInterface, interface);
    if (r) r = detail::ValidateName(detail::NameKind::kMember, member);
    if (!r) return expected<Message, Error>::error(r.get_error());
    return Wrap(
        dbus_message_new_signal(path.c_str(), interface.c_str(), member.c_str()));
  }

  /**
   * @brief Builds an error message that never travelled on the wire.
   *
   * Used to complete calls locally (connection closed, send failed).
   */
  static Message LocalError(const std::string& name, const std::string& text,
                            uint32_t reply_serial = 0U) {
    DBusMessage* raw = dbus_message_new(DBUS_MESSAGE_TYPE_ERROR);
    if (raw == nullptr) return Message();
    Message m = Adopt(raw);
    if (dbus_message_set_error_name(raw, name.c_str()) == FALSE) {
      return Message();
    }
    if (reply_serial != 0U) {
      (void)dbus_message_set_reply_serial(raw, reply_serial);
    }
    if (!text.empty()) {
      auto r = AppendArgs(raw, "s", ValueList{text});
      if (!r) return Message();
    }
    return m;
  }

  // --- Headers ---

  bool IsValid() const noexcept { return raw_ != nullptr; }
  explicit operator bool() const noexcept { return IsValid(); }

  MessageType Type() const noexcept {
    if (raw_ == nullptr) return MessageType::kInvalid;
    switch (dbus_message_get_type(raw_)) {
      case DBUS_MESSAGE_TYPE_METHOD_CALL:
        return MessageType::kMethodCall;
      case DBUS_MESSAGE_TYPE_METHOD_RETURN:
        return MessageType::kMethodReturn;
      case DBUS_MESSAGE_TYPE_ERROR:
        return MessageType::kError;
      case DBUS_MESSAGE_TYPE_SIGNAL:
        return MessageType::kSignal;
      default:
        return MessageType::kInvalid;
    }
  }

  std::string Path() const { return Header(&dbus_message_get_path); }
  std::string Interface() const { return Header(&dbus_message_get_interface); }
  std::string Member() const { return Header(&dbus_message_get_member); }
  std::string Sender() const { return Header(&dbus_message_get_sender); }
  std::string Destination() const {
    return Header(&dbus_message_get_destination);
  }
  std::string ErrorName() const { return Header(&dbus_message_get_error_name); }
  std::string Signature() const { return Header(&dbus_message_get_signature); }

  uint32_t Serial() const noexcept {
    return raw_ != nullptr ? dbus_message_get_serial(raw_) : 0U;
  }
  uint32_t ReplySerial() const noexcept {
    return raw_ != nullptr ? dbus_message_get_reply_serial(raw_) : 0U;
  }
  bool NoReply() const noexcept {
    return raw_ != nullptr && dbus_message_get_no_reply(raw_) != FALSE;
  }
  void SetNoReply(bool no_reply) noexcept {
    if (raw_ != nullptr) {
      dbus_message_set_no_reply(raw_, no_reply ? TRUE : FALSE);
    }
  }

  /** @brief Whether the bus may launch the destination service. */
  bool AutoStart() const noexcept {
    return raw_ != nullptr && dbus_message_get_auto_start(raw_) != FALSE;
  }
  void SetAutoStart(bool auto_start) noexcept {
    if (raw_ != nullptr) {
      dbus_message_set_auto_start(raw_, auto_start ? TRUE : FALSE);
    }
  }

  bool SetDestination(const std::string& destination) {
    if (raw_ == nullptr) return false;
    return dbus_message_set_destination(
               raw_, destination.empty() ? nullptr : destination.c_str()) !=
           FALSE;
  }

  // --- Payload ---

  /** @brief Appends @p args typed by @p signature; nothing is written on error. */
  expected<void, Error> SetArgs(const std::string& signature,
                                const ValueList& args) {
    if (raw_ == nullptr) {
      return expected<void, Error>::error(
          Error(errors::kInvalidArgs, "message is empty"));
    }
    return AppendArgs(raw_, signature, args);
  }

  ValueList Args() const {
    return raw_ != nullptr ? ReadArgs(raw_) : ValueList{};
  }

  /** @brief First string argument of an error message, if any. */
  std::string ErrorText() const {
    if (raw_ == nullptr) return std::string();
    ValueList args = ReadArgs(raw_);
    if (!args.empty() && args.front().kind() == Value::Kind::kString) {
      return args.front().AsString();
    }
    return std::string();
  }

  DBusMessage* raw() const noexcept { return raw_; }

  /** @brief Gives up ownership of the held reference. */
  DBusMessage* Release() noexcept {
    DBusMessage* out = raw_;
    raw_ = nullptr;
    return out;
  }

 private:
  static expected<Message, Error> Wrap(DBusMessage* raw) {
    if (raw == nullptr) return expected<Message, Error>::error(NoMemoryError());
    return expected<Message, Error>::success(Adopt(raw));
  }

  std::string Header(const char* (*getter)(DBusMessage*)) const {
    return raw_ != nullptr ? detail::CopyHeader(getter(raw_)) : std::string();
  }

  void Reset() noexcept {
    if (raw_ != nullptr) {
      dbus_message_unref(raw_);
      raw_ = nullptr;
    }
  }

  DBusMessage* raw_ = nullptr;
};

}  // namespace ebus

#endif  // EBUS_MESSAGE_HPP_
