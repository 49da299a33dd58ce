/**
 * @file error.hpp
 * @brief Named bus errors and the DBusError RAII holder.
 */

#ifndef EBUS_ERROR_HPP_
#define EBUS_ERROR_HPP_

#include "ebus/vocabulary.hpp"

#include <dbus/dbus.h>

#include <string>
#include <utility>

namespace ebus {

// ============================================================================
// Well-known Error Names
// ============================================================================

namespace errors {

constexpr const char* kFailed = DBUS_ERROR_FAILED;
constexpr const char* kNoMemory = DBUS_ERROR_NO_MEMORY;
constexpr const char* kNoReply = DBUS_ERROR_NO_REPLY;
constexpr const char* kTimeout = DBUS_ERROR_TIMEOUT;
constexpr const char* kIoError = DBUS_ERROR_IO_ERROR;
constexpr const char* kDisconnected = DBUS_ERROR_DISCONNECTED;
constexpr const char* kInvalidArgs = DBUS_ERROR_INVALID_ARGS;
constexpr const char* kInvalidSignature = DBUS_ERROR_INVALID_SIGNATURE;
constexpr const char* kUnknownMethod = DBUS_ERROR_UNKNOWN_METHOD;

/// Reply sent when a method handler fails without naming an error.
constexpr const char* kUncaughtException = "org.ebus.Error.UncaughtException";

}  // namespace errors

// ============================================================================
// Error
// ============================================================================

/**
 * @brief A symbolic bus error name plus human-readable text.
 *
 * Used for transport failures, error replies received from peers, handler
 * failures and local validation failures alike.
 */
struct Error {
  std::string name;
  std::string message;

  Error() = default;
  Error(std::string error_name, std::string text)
      : name(std::move(error_name)), message(std::move(text)) {}

  bool Is(const char* error_name) const { return name == error_name; }

  /** @brief True for the synthetic reply a timed-out call receives. */
  bool IsTimeout() const {
    return name == errors::kNoReply || name == errors::kTimeout;
  }
};

// ============================================================================
// ScopedDBusError
// ============================================================================

/** @brief Owns a DBusError for the duration of one libdbus call sequence. */
class ScopedDBusError {
 public:
  ScopedDBusError() noexcept { dbus_error_init(&raw_); }
  ~ScopedDBusError() { dbus_error_free(&raw_); }

  ScopedDBusError(const ScopedDBusError&) = delete;
  ScopedDBusError& operator=(const ScopedDBusError&) = delete;

  DBusError* get() noexcept { return &raw_; }
  bool IsSet() const noexcept { return dbus_error_is_set(&raw_) != FALSE; }

  /**
   * @brief Converts to an Error; @p fallback_name is used when libdbus
   *        reported failure without setting a name.
   */
  Error ToError(const char* fallback_name = errors::kFailed) const {
    if (!IsSet()) return Error(fallback_name, "");
    return Error(raw_.name, raw_.message != nullptr ? raw_.message : "");
  }

 private:
  DBusError raw_;
};

inline Error NoMemoryError() {
  return Error(errors::kNoMemory, "out of memory");
}

inline Error NotOpenError() {
  return Error(errors::kDisconnected, "connection is not open");
}

}  // namespace ebus

#endif  // EBUS_ERROR_HPP_
