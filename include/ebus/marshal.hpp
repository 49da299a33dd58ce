/**
 * @file marshal.hpp
 * @brief Conversion between Value trees and libdbus message iterators.
 *
 * Appending runs in two passes. CheckArgs walks the signature against the
 * values (integer ranges, string/path/signature validity, container shapes,
 * argument count) without touching the message, so a rejected payload leaves
 * the message unchanged. AppendArgs then writes the already-checked values;
 * the only failure left at that point is out-of-memory.
 */

#ifndef EBUS_MARSHAL_HPP_
#define EBUS_MARSHAL_HPP_

#include "ebus/error.hpp"
#include "ebus/value.hpp"
#include "ebus/vocabulary.hpp"

#include <dbus/dbus.h>

#include <cstdint>
#include <limits>
#include <string>
#include <unistd.h>

namespace ebus {

namespace detail {

inline Error InvalidArgs(const std::string& text) {
  return Error(errors::kInvalidArgs, text);
}

inline std::string TypeName(int type) {
  char code[2] = {static_cast<char>(type), '\0'};
  return std::string("'") + code + "'";
}

inline expected<void, Error> CheckSigned(const Value& v, int type, int64_t lo,
                                         int64_t hi) {
  if (v.kind() == Value::Kind::kInt) {
    if (v.AsInt() >= lo && v.AsInt() <= hi) {
      return expected<void, Error>::success();
    }
  } else if (v.kind() == Value::Kind::kUInt) {
    if (v.AsUInt() <= static_cast<uint64_t>(hi)) {
      return expected<void, Error>::success();
    }
  } else {
    return expected<void, Error>::error(
        InvalidArgs("expected an integer for " + TypeName(type) + ", got " +
                    v.ToString()));
  }
  return expected<void, Error>::error(
      InvalidArgs("value " + v.ToString() + " out of range for " +
                  TypeName(type)));
}

inline expected<void, Error> CheckUnsigned(const Value& v, int type,
                                           uint64_t hi) {
  if (v.kind() == Value::Kind::kUInt) {
    if (v.AsUInt() <= hi) return expected<void, Error>::success();
  } else if (v.kind() == Value::Kind::kInt) {
    if (v.AsInt() >= 0 && static_cast<uint64_t>(v.AsInt()) <= hi) {
      return expected<void, Error>::success();
    }
  } else {
    return expected<void, Error>::error(
        InvalidArgs("expected an integer for " + TypeName(type) + ", got " +
                    v.ToString()));
  }
  return expected<void, Error>::error(
      InvalidArgs("value " + v.ToString() + " out of range for " +
                  TypeName(type)));
}

inline expected<void, Error> CheckValue(DBusSignatureIter* sig,
                                        const Value& v);

inline expected<void, Error> CheckString(const Value& v, int type) {
  if (v.kind() != Value::Kind::kString) {
    return expected<void, Error>::error(InvalidArgs(
        "expected a string for " + TypeName(type) + ", got " + v.ToString()));
  }
  const char* s = v.AsString().c_str();
  bool ok = false;
  if (type == DBUS_TYPE_OBJECT_PATH) {
    ok = dbus_validate_path(s, nullptr) != FALSE;
  } else if (type == DBUS_TYPE_SIGNATURE) {
    ok = dbus_signature_validate(s, nullptr) != FALSE;
  } else {
    ok = dbus_validate_utf8(s, nullptr) != FALSE;
  }
  if (!ok || v.AsString().find('\0') != std::string::npos) {
    return expected<void, Error>::error(
        InvalidArgs("invalid value " + v.ToString() + " for " +
                    TypeName(type)));
  }
  return expected<void, Error>::success();
}

inline expected<void, Error> CheckContainer(DBusSignatureIter* sig,
                                            const Value& v) {
  const int type = dbus_signature_iter_get_current_type(sig);
  DBusSignatureIter sub;

  if (type == DBUS_TYPE_ARRAY) {
    dbus_signature_iter_recurse(sig, &sub);
    if (dbus_signature_iter_get_element_type(sig) == DBUS_TYPE_DICT_ENTRY) {
      if (v.kind() != Value::Kind::kDict) {
        return expected<void, Error>::error(
            InvalidArgs("expected a dict, got " + v.ToString()));
      }
      DBusSignatureIter key_sig;
      dbus_signature_iter_recurse(&sub, &key_sig);
      for (const auto& entry : v.AsDict()) {
        DBusSignatureIter k = key_sig;
        auto r = CheckValue(&k, entry.first);
        if (!r) return r;
        dbus_signature_iter_next(&k);
        r = CheckValue(&k, entry.second);
        if (!r) return r;
      }
      return expected<void, Error>::success();
    }
    if (v.kind() != Value::Kind::kList) {
      return expected<void, Error>::error(
          InvalidArgs("expected a list, got " + v.ToString()));
    }
    for (const auto& item : v.AsList()) {
      DBusSignatureIter elem = sub;
      auto r = CheckValue(&elem, item);
      if (!r) return r;
    }
    return expected<void, Error>::success();
  }

  if (type == DBUS_TYPE_STRUCT) {
    if (v.kind() != Value::Kind::kList) {
      return expected<void, Error>::error(
          InvalidArgs("expected a struct, got " + v.ToString()));
    }
    dbus_signature_iter_recurse(sig, &sub);
    const auto& fields = v.AsList();
    size_t i = 0;
    do {
      if (i >= fields.size()) {
        return expected<void, Error>::error(
            InvalidArgs("too few fields in struct " + v.ToString()));
      }
      auto r = CheckValue(&sub, fields[i]);
      if (!r) return r;
      ++i;
    } while (dbus_signature_iter_next(&sub) != FALSE);
    if (i != fields.size()) {
      return expected<void, Error>::error(
          InvalidArgs("too many fields in struct " + v.ToString()));
    }
    return expected<void, Error>::success();
  }

  // DBUS_TYPE_VARIANT
  if (v.kind() != Value::Kind::kVariant) {
    return expected<void, Error>::error(
        InvalidArgs("expected a variant, got " + v.ToString()));
  }
  const std::string& inner = v.VariantSignature();
  if (dbus_signature_validate_single(inner.c_str(), nullptr) == FALSE) {
    return expected<void, Error>::error(
        InvalidArgs("invalid variant signature '" + inner + "'"));
  }
  dbus_signature_iter_init(&sub, inner.c_str());
  return CheckValue(&sub, v.VariantValue());
}

inline expected<void, Error> CheckValue(DBusSignatureIter* sig,
                                        const Value& v) {
  const int type = dbus_signature_iter_get_current_type(sig);
  switch (type) {
    case DBUS_TYPE_BYTE:
      return CheckUnsigned(v, type, std::numeric_limits<uint8_t>::max());
    case DBUS_TYPE_BOOLEAN:
      if (v.kind() == Value::Kind::kBool || v.IsInteger()) {
        return expected<void, Error>::success();
      }
      return expected<void, Error>::error(
          InvalidArgs("expected a boolean, got " + v.ToString()));
    case DBUS_TYPE_INT16:
      return CheckSigned(v, type, std::numeric_limits<int16_t>::min(),
                         std::numeric_limits<int16_t>::max());
    case DBUS_TYPE_UINT16:
      return CheckUnsigned(v, type, std::numeric_limits<uint16_t>::max());
    case DBUS_TYPE_INT32:
      return CheckSigned(v, type, std::numeric_limits<int32_t>::min(),
                         std::numeric_limits<int32_t>::max());
    case DBUS_TYPE_UINT32:
      return CheckUnsigned(v, type, std::numeric_limits<uint32_t>::max());
    case DBUS_TYPE_INT64:
      return CheckSigned(v, type, std::numeric_limits<int64_t>::min(),
                         std::numeric_limits<int64_t>::max());
    case DBUS_TYPE_UINT64:
      return CheckUnsigned(v, type, std::numeric_limits<uint64_t>::max());
    case DBUS_TYPE_DOUBLE:
      if (v.kind() == Value::Kind::kDouble || v.IsInteger()) {
        return expected<void, Error>::success();
      }
      return expected<void, Error>::error(
          InvalidArgs("expected a number, got " + v.ToString()));
    case DBUS_TYPE_STRING:
    case DBUS_TYPE_OBJECT_PATH:
    case DBUS_TYPE_SIGNATURE:
      return CheckString(v, type);
    case DBUS_TYPE_ARRAY:
    case DBUS_TYPE_STRUCT:
    case DBUS_TYPE_VARIANT:
      return CheckContainer(sig, v);
    default:
      return expected<void, Error>::error(
          InvalidArgs("unsupported type " + TypeName(type)));
  }
}

// ----------------------------------------------------------------------------
// Append (values already checked)
// ----------------------------------------------------------------------------

template <typename T>
inline bool AppendBasic(DBusMessageIter* it, int type, T raw) {
  return dbus_message_iter_append_basic(it, type, &raw) != FALSE;
}

inline bool AppendValue(DBusMessageIter* it, DBusSignatureIter* sig,
                        const Value& v);

inline bool AppendContainer(DBusMessageIter* it, DBusSignatureIter* sig,
                            const Value& v) {
  const int type = dbus_signature_iter_get_current_type(sig);
  DBusSignatureIter sub;
  DBusMessageIter child;

  if (type == DBUS_TYPE_ARRAY) {
    dbus_signature_iter_recurse(sig, &sub);
    char* elem_sig = dbus_signature_iter_get_signature(&sub);
    if (elem_sig == nullptr) return false;
    const bool opened =
        dbus_message_iter_open_container(it, DBUS_TYPE_ARRAY, elem_sig,
                                         &child) != FALSE;
    dbus_free(elem_sig);
    if (!opened) return false;

    bool ok = true;
    if (dbus_signature_iter_get_element_type(sig) == DBUS_TYPE_DICT_ENTRY) {
      DBusSignatureIter key_sig;
      dbus_signature_iter_recurse(&sub, &key_sig);
      for (const auto& entry : v.AsDict()) {
        DBusMessageIter entry_it;
        if (dbus_message_iter_open_container(&child, DBUS_TYPE_DICT_ENTRY,
                                             nullptr, &entry_it) == FALSE) {
          ok = false;
          break;
        }
        DBusSignatureIter k = key_sig;
        ok = AppendValue(&entry_it, &k, entry.first);
        if (ok) {
          dbus_signature_iter_next(&k);
          ok = AppendValue(&entry_it, &k, entry.second);
        }
        if (!ok) {
          dbus_message_iter_abandon_container_if_open(&child, &entry_it);
          break;
        }
        if (dbus_message_iter_close_container(&child, &entry_it) == FALSE) {
          ok = false;
          break;
        }
      }
    } else {
      for (const auto& item : v.AsList()) {
        DBusSignatureIter elem = sub;
        if (!AppendValue(&child, &elem, item)) {
          ok = false;
          break;
        }
      }
    }
    if (!ok) {
      dbus_message_iter_abandon_container_if_open(it, &child);
      return false;
    }
    return dbus_message_iter_close_container(it, &child) != FALSE;
  }

  if (type == DBUS_TYPE_STRUCT) {
    if (dbus_message_iter_open_container(it, DBUS_TYPE_STRUCT, nullptr,
                                         &child) == FALSE) {
      return false;
    }
    dbus_signature_iter_recurse(sig, &sub);
    for (const auto& field : v.AsList()) {
      if (!AppendValue(&child, &sub, field)) {
        dbus_message_iter_abandon_container_if_open(it, &child);
        return false;
      }
      dbus_signature_iter_next(&sub);
    }
    return dbus_message_iter_close_container(it, &child) != FALSE;
  }

  // DBUS_TYPE_VARIANT
  const std::string& inner = v.VariantSignature();
  if (dbus_message_iter_open_container(it, DBUS_TYPE_VARIANT, inner.c_str(),
                                       &child) == FALSE) {
    return false;
  }
  dbus_signature_iter_init(&sub, inner.c_str());
  if (!AppendValue(&child, &sub, v.VariantValue())) {
    dbus_message_iter_abandon_container_if_open(it, &child);
    return false;
  }
  return dbus_message_iter_close_container(it, &child) != FALSE;
}

inline bool AppendValue(DBusMessageIter* it, DBusSignatureIter* sig,
                        const Value& v) {
  const int type = dbus_signature_iter_get_current_type(sig);
  switch (type) {
    case DBUS_TYPE_BYTE:
      return AppendBasic(it, type, static_cast<uint8_t>(v.AsUInt()));
    case DBUS_TYPE_BOOLEAN:
      return AppendBasic(it, type,
                         static_cast<dbus_bool_t>(v.AsBool() ? TRUE : FALSE));
    case DBUS_TYPE_INT16:
      return AppendBasic(it, type, static_cast<dbus_int16_t>(v.AsInt()));
    case DBUS_TYPE_UINT16:
      return AppendBasic(it, type, static_cast<dbus_uint16_t>(v.AsUInt()));
    case DBUS_TYPE_INT32:
      return AppendBasic(it, type, static_cast<dbus_int32_t>(v.AsInt()));
    case DBUS_TYPE_UINT32:
      return AppendBasic(it, type, static_cast<dbus_uint32_t>(v.AsUInt()));
    case DBUS_TYPE_INT64:
      return AppendBasic(it, type, static_cast<dbus_int64_t>(v.AsInt()));
    case DBUS_TYPE_UINT64:
      return AppendBasic(it, type, static_cast<dbus_uint64_t>(v.AsUInt()));
    case DBUS_TYPE_DOUBLE:
      return AppendBasic(it, type, v.AsDouble());
    case DBUS_TYPE_STRING:
    case DBUS_TYPE_OBJECT_PATH:
    case DBUS_TYPE_SIGNATURE:
      return AppendBasic(it, type, v.AsString().c_str());
    default:
      return AppendContainer(it, sig, v);
  }
}

// ----------------------------------------------------------------------------
// Read
// ----------------------------------------------------------------------------

inline Value ReadValue(DBusMessageIter* it) {
  const int type = dbus_message_iter_get_arg_type(it);
  switch (type) {
    case DBUS_TYPE_BYTE: {
      uint8_t raw = 0;
      dbus_message_iter_get_basic(it, &raw);
      return Value(raw);
    }
    case DBUS_TYPE_BOOLEAN: {
      dbus_bool_t raw = FALSE;
      dbus_message_iter_get_basic(it, &raw);
      return Value(raw != FALSE);
    }
    case DBUS_TYPE_INT16: {
      dbus_int16_t raw = 0;
      dbus_message_iter_get_basic(it, &raw);
      return Value(raw);
    }
    case DBUS_TYPE_UINT16: {
      dbus_uint16_t raw = 0;
      dbus_message_iter_get_basic(it, &raw);
      return Value(raw);
    }
    case DBUS_TYPE_INT32: {
      dbus_int32_t raw = 0;
      dbus_message_iter_get_basic(it, &raw);
      return Value(raw);
    }
    case DBUS_TYPE_UINT32: {
      dbus_uint32_t raw = 0;
      dbus_message_iter_get_basic(it, &raw);
      return Value(raw);
    }
    case DBUS_TYPE_INT64: {
      dbus_int64_t raw = 0;
      dbus_message_iter_get_basic(it, &raw);
      return Value(static_cast<int64_t>(raw));
    }
    case DBUS_TYPE_UINT64: {
      dbus_uint64_t raw = 0;
      dbus_message_iter_get_basic(it, &raw);
      return Value(static_cast<uint64_t>(raw));
    }
    case DBUS_TYPE_DOUBLE: {
      double raw = 0.0;
      dbus_message_iter_get_basic(it, &raw);
      return Value(raw);
    }
    case DBUS_TYPE_STRING:
    case DBUS_TYPE_OBJECT_PATH:
    case DBUS_TYPE_SIGNATURE: {
      const char* raw = nullptr;
      dbus_message_iter_get_basic(it, &raw);
      return Value(raw);
    }
    case DBUS_TYPE_UNIX_FD: {
      // The received descriptor is a dup owned by the reader; unix fds are
      // not carried by Value.
      int fd = -1;
      dbus_message_iter_get_basic(it, &fd);
      if (fd >= 0) ::close(fd);
      return Value();
    }
    case DBUS_TYPE_ARRAY: {
      DBusMessageIter sub;
      dbus_message_iter_recurse(it, &sub);
      if (dbus_message_iter_get_element_type(it) == DBUS_TYPE_DICT_ENTRY) {
        ValueDict entries;
        while (dbus_message_iter_get_arg_type(&sub) == DBUS_TYPE_DICT_ENTRY) {
          DBusMessageIter entry;
          dbus_message_iter_recurse(&sub, &entry);
          Value key = ReadValue(&entry);
          dbus_message_iter_next(&entry);
          entries.emplace_back(std::move(key), ReadValue(&entry));
          dbus_message_iter_next(&sub);
        }
        return Value::MakeDict(std::move(entries));
      }
      ValueList items;
      while (dbus_message_iter_get_arg_type(&sub) != DBUS_TYPE_INVALID) {
        items.push_back(ReadValue(&sub));
        dbus_message_iter_next(&sub);
      }
      return Value::MakeList(std::move(items));
    }
    case DBUS_TYPE_STRUCT: {
      DBusMessageIter sub;
      dbus_message_iter_recurse(it, &sub);
      ValueList fields;
      while (dbus_message_iter_get_arg_type(&sub) != DBUS_TYPE_INVALID) {
        fields.push_back(ReadValue(&sub));
        dbus_message_iter_next(&sub);
      }
      return Value::MakeList(std::move(fields));
    }
    case DBUS_TYPE_VARIANT: {
      DBusMessageIter sub;
      dbus_message_iter_recurse(it, &sub);
      char* raw_sig = dbus_message_iter_get_signature(&sub);
      std::string inner_sig = (raw_sig != nullptr) ? raw_sig : "";
      dbus_free(raw_sig);
      return Value::MakeVariant(std::move(inner_sig), ReadValue(&sub));
    }
    default:
      return Value();
  }
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

/**
 * @brief Checks that @p args match @p signature exactly.
 *
 * Fails with InvalidSignature for a malformed signature and InvalidArgs for
 * a count, shape or range mismatch.
 */
inline expected<void, Error> CheckArgs(const std::string& signature,
                                       const ValueList& args) {
  ScopedDBusError err;
  if (dbus_signature_validate(signature.c_str(), err.get()) == FALSE) {
    return expected<void, Error>::error(
        Error(errors::kInvalidSignature,
              "invalid signature '" + signature + "'"));
  }
  if (signature.empty()) {
    if (!args.empty()) {
      return expected<void, Error>::error(
          detail::InvalidArgs("too many arguments for empty signature"));
    }
    return expected<void, Error>::success();
  }

  DBusSignatureIter sig;
  dbus_signature_iter_init(&sig, signature.c_str());
  size_t i = 0;
  do {
    if (i >= args.size()) {
      return expected<void, Error>::error(detail::InvalidArgs(
          "too few arguments for signature '" + signature + "'"));
    }
    auto r = detail::CheckValue(&sig, args[i]);
    if (!r) return r;
    ++i;
  } while (dbus_signature_iter_next(&sig) != FALSE);

  if (i != args.size()) {
    return expected<void, Error>::error(detail::InvalidArgs(
        "too many arguments for signature '" + signature + "'"));
  }
  return expected<void, Error>::success();
}

/** @brief Checks then appends @p args to the end of @p msg. */
inline expected<void, Error> AppendArgs(DBusMessage* msg,
                                        const std::string& signature,
                                        const ValueList& args) {
  auto checked = CheckArgs(signature, args);
  if (!checked) return checked;
  if (signature.empty()) return expected<void, Error>::success();

  DBusMessageIter it;
  dbus_message_iter_init_append(msg, &it);
  DBusSignatureIter sig;
  dbus_signature_iter_init(&sig, signature.c_str());
  for (const auto& arg : args) {
    if (!detail::AppendValue(&it, &sig, arg)) {
      return expected<void, Error>::error(NoMemoryError());
    }
    dbus_signature_iter_next(&sig);
  }
  return expected<void, Error>::success();
}

/** @brief Reads every argument of @p msg. */
inline ValueList ReadArgs(DBusMessage* msg) {
  ValueList out;
  DBusMessageIter it;
  if (dbus_message_iter_init(msg, &it) == FALSE) return out;
  do {
    out.push_back(detail::ReadValue(&it));
  } while (dbus_message_iter_next(&it) != FALSE);
  return out;
}

}  // namespace ebus

#endif  // EBUS_MARSHAL_HPP_
