/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all ebus modules.
 *
 * - expected<V, E>: value-or-error return type (success()/error() factories)
 * - optional<T>: alias of std::optional
 * - Module error enums that are used across headers
 * - Monotonic clock helpers
 */

#ifndef EBUS_VOCABULARY_HPP_
#define EBUS_VOCABULARY_HPP_

#include "ebus/platform.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace ebus {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
using optional = std::optional<T>;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construction goes through the named factories so that V and E may be the
 * same type. Accessing the wrong alternative is a programming error and is
 * caught by EBUS_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected {
 public:
  using value_type = V;
  using error_type = E;

  static expected success(const V& v) {
    return expected(std::in_place_index<0>, v);
  }
  static expected success(V&& v) {
    return expected(std::in_place_index<0>, std::move(v));
  }
  static expected error(const E& e) {
    return expected(std::in_place_index<1>, e);
  }
  static expected error(E&& e) {
    return expected(std::in_place_index<1>, std::move(e));
  }

  bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() & {
    EBUS_ASSERT(has_value());
    return *std::get_if<0>(&storage_);
  }
  const V& value() const& {
    EBUS_ASSERT(has_value());
    return *std::get_if<0>(&storage_);
  }
  V&& value() && {
    EBUS_ASSERT(has_value());
    return std::move(*std::get_if<0>(&storage_));
  }

  const E& get_error() const& {
    EBUS_ASSERT(!has_value());
    return *std::get_if<1>(&storage_);
  }
  E&& get_error() && {
    EBUS_ASSERT(!has_value());
    return std::move(*std::get_if<1>(&storage_));
  }

  template <typename U>
  V value_or(U&& fallback) const& {
    return has_value() ? *std::get_if<0>(&storage_)
                       : static_cast<V>(std::forward<U>(fallback));
  }

 private:
  template <std::size_t I, typename Arg>
  expected(std::in_place_index_t<I> tag, Arg&& arg)
      : storage_(tag, std::forward<Arg>(arg)) {}

  std::variant<V, E> storage_;
};

/** @brief Specialization for operations that only report success or error. */
template <typename E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  static expected success() noexcept { return expected(); }
  static expected error(const E& e) { return expected(e); }
  static expected error(E&& e) { return expected(std::move(e)); }

  bool has_value() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  const E& get_error() const& {
    EBUS_ASSERT(!has_value());
    return *error_;
  }
  E&& get_error() && {
    EBUS_ASSERT(!has_value());
    return std::move(*error_);
  }

 private:
  expected() noexcept = default;
  explicit expected(const E& e) : error_(e) {}
  explicit expected(E&& e) : error_(std::move(e)) {}

  std::optional<E> error_;
};

// ============================================================================
// Clock Helpers
// ============================================================================

/** @brief Monotonic time in microseconds. */
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/** @brief Monotonic time in milliseconds. */
inline uint64_t SteadyNowMs() noexcept { return SteadyNowUs() / 1000U; }

}  // namespace ebus

#endif  // EBUS_VOCABULARY_HPP_
