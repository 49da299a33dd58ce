/**
 * @file value.hpp
 * @brief Dynamically typed argument tree carried by bus messages.
 *
 * A Value is what one complete type of a signature marshals from/to:
 *
 * | Signature          | Kind      |
 * |--------------------|-----------|
 * | b                  | kBool     |
 * | n i x              | kInt      |
 * | y q u t            | kUInt     |
 * | d                  | kDouble   |
 * | s o g              | kString   |
 * | a<T>, (...)        | kList     |
 * | a{KV}              | kDict     |
 * | v                  | kVariant  |
 *
 * Signed and unsigned integers compare numerically, so Value(42) equals
 * Value(42U).
 */

#ifndef EBUS_VALUE_HPP_
#define EBUS_VALUE_HPP_

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ebus {

class Value;

using ValueList = std::vector<Value>;
using ValueDict = std::vector<std::pair<Value, Value>>;

class Value {
 public:
  enum class Kind : uint8_t {
    kNone = 0,
    kBool,
    kInt,
    kUInt,
    kDouble,
    kString,
    kList,
    kDict,
    kVariant,
  };

  Value() = default;

  Value(bool v) noexcept : kind_(Kind::kBool), uint_(v ? 1U : 0U) {}

  template <typename T,
            typename std::enable_if<std::is_integral<T>::value &&
                                        !std::is_same<T, bool>::value &&
                                        std::is_signed<T>::value,
                                    int>::type = 0>
  Value(T v) noexcept : kind_(Kind::kInt), int_(static_cast<int64_t>(v)) {}

  template <typename T,
            typename std::enable_if<std::is_integral<T>::value &&
                                        !std::is_same<T, bool>::value &&
                                        std::is_unsigned<T>::value,
                                    int>::type = 0>
  Value(T v) noexcept : kind_(Kind::kUInt), uint_(static_cast<uint64_t>(v)) {}

  template <typename T,
            typename std::enable_if<std::is_floating_point<T>::value,
                                    int>::type = 0>
  Value(T v) noexcept : kind_(Kind::kDouble), double_(static_cast<double>(v)) {}

  Value(const char* v) : kind_(Kind::kString), str_(v != nullptr ? v : "") {}
  Value(std::string v) : kind_(Kind::kString), str_(std::move(v)) {}

  static Value MakeList(ValueList items);
  static Value MakeDict(ValueDict entries);
  static Value MakeVariant(std::string signature, Value inner);

  Kind kind() const noexcept { return kind_; }
  bool IsNone() const noexcept { return kind_ == Kind::kNone; }
  bool IsInteger() const noexcept {
    return kind_ == Kind::kInt || kind_ == Kind::kUInt;
  }

  bool AsBool() const noexcept;
  int64_t AsInt() const noexcept;
  uint64_t AsUInt() const noexcept;
  double AsDouble() const noexcept;
  const std::string& AsString() const noexcept { return str_; }
  const ValueList& AsList() const noexcept { return list_; }
  const ValueDict& AsDict() const noexcept { return dict_; }

  /** @brief Inner signature of a kVariant. */
  const std::string& VariantSignature() const noexcept { return str_; }
  /** @brief Inner value of a kVariant. */
  const Value& VariantValue() const noexcept;

  /** @brief Debug rendering, e.g. `(1, "a", {"k": 2.5})`. */
  std::string ToString() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  Kind kind_ = Kind::kNone;
  int64_t int_ = 0;
  uint64_t uint_ = 0;
  double double_ = 0.0;
  std::string str_;
  // kList items, or the single inner value of a kVariant.
  ValueList list_;
  ValueDict dict_;
};

// ============================================================================
// Inline Implementation
// ============================================================================

inline Value Value::MakeList(ValueList items) {
  Value v;
  v.kind_ = Kind::kList;
  v.list_ = std::move(items);
  return v;
}

inline Value Value::MakeDict(ValueDict entries) {
  Value v;
  v.kind_ = Kind::kDict;
  v.dict_ = std::move(entries);
  return v;
}

inline Value Value::MakeVariant(std::string signature, Value inner) {
  Value v;
  v.kind_ = Kind::kVariant;
  v.str_ = std::move(signature);
  v.list_.push_back(std::move(inner));
  return v;
}

inline bool Value::AsBool() const noexcept {
  switch (kind_) {
    case Kind::kBool:
    case Kind::kUInt:
      return uint_ != 0U;
    case Kind::kInt:
      return int_ != 0;
    case Kind::kDouble:
      return double_ != 0.0;
    default:
      return false;
  }
}

inline int64_t Value::AsInt() const noexcept {
  switch (kind_) {
    case Kind::kInt:
      return int_;
    case Kind::kBool:
    case Kind::kUInt:
      return static_cast<int64_t>(uint_);
    case Kind::kDouble:
      return static_cast<int64_t>(double_);
    default:
      return 0;
  }
}

inline uint64_t Value::AsUInt() const noexcept {
  switch (kind_) {
    case Kind::kBool:
    case Kind::kUInt:
      return uint_;
    case Kind::kInt:
      return static_cast<uint64_t>(int_);
    case Kind::kDouble:
      return static_cast<uint64_t>(double_);
    default:
      return 0U;
  }
}

inline double Value::AsDouble() const noexcept {
  switch (kind_) {
    case Kind::kDouble:
      return double_;
    case Kind::kInt:
      return static_cast<double>(int_);
    case Kind::kBool:
    case Kind::kUInt:
      return static_cast<double>(uint_);
    default:
      return 0.0;
  }
}

inline const Value& Value::VariantValue() const noexcept {
  static const Value kNoneValue;
  return (kind_ == Kind::kVariant && !list_.empty()) ? list_.front()
                                                     : kNoneValue;
}

inline bool Value::operator==(const Value& other) const {
  if (IsInteger() && other.IsInteger()) {
    if (kind_ == other.kind_) {
      return kind_ == Kind::kInt ? int_ == other.int_ : uint_ == other.uint_;
    }
    const Value& s = (kind_ == Kind::kInt) ? *this : other;
    const Value& u = (kind_ == Kind::kInt) ? other : *this;
    return s.int_ >= 0 && static_cast<uint64_t>(s.int_) == u.uint_;
  }
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case Kind::kNone:
      return true;
    case Kind::kBool:
      return uint_ == other.uint_;
    case Kind::kDouble:
      return double_ == other.double_;
    case Kind::kString:
      return str_ == other.str_;
    case Kind::kList:
      return list_ == other.list_;
    case Kind::kDict:
      return dict_ == other.dict_;
    case Kind::kVariant:
      return str_ == other.str_ && list_ == other.list_;
    default:
      return false;
  }
}

inline std::string Value::ToString() const {
  switch (kind_) {
    case Kind::kNone:
      return "None";
    case Kind::kBool:
      return uint_ != 0U ? "true" : "false";
    case Kind::kInt:
      return std::to_string(int_);
    case Kind::kUInt:
      return std::to_string(uint_);
    case Kind::kDouble:
      return std::to_string(double_);
    case Kind::kString:
      return "\"" + str_ + "\"";
    case Kind::kList: {
      std::string out = "(";
      for (size_t i = 0; i < list_.size(); ++i) {
        if (i != 0U) out += ", ";
        out += list_[i].ToString();
      }
      return out + ")";
    }
    case Kind::kDict: {
      std::string out = "{";
      for (size_t i = 0; i < dict_.size(); ++i) {
        if (i != 0U) out += ", ";
        out += dict_[i].first.ToString() + ": " + dict_[i].second.ToString();
      }
      return out + "}";
    }
    case Kind::kVariant:
      return "<" + str_ + " " + VariantValue().ToString() + ">";
    default:
      return "?";
  }
}

}  // namespace ebus

#endif  // EBUS_VALUE_HPP_
