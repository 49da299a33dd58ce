/**
 * @file platform.hpp
 * @brief printf-format attribute and the debug assertion macro.
 */

#ifndef EBUS_PLATFORM_HPP_
#define EBUS_PLATFORM_HPP_

#include <cstdio>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#define EBUS_PRINTF_FORMAT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define EBUS_PRINTF_FORMAT(fmt_idx, arg_idx)
#endif

namespace ebus {
namespace detail {

/** @brief Reports a failed EBUS_ASSERT on stderr and aborts. */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "ebus: assertion `%s' failed (%s:%d)\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail
}  // namespace ebus

/// Debug-only invariant check; compiled out under NDEBUG.
#ifdef NDEBUG
#define EBUS_ASSERT(cond) ((void)0)
#else
#define EBUS_ASSERT(cond) \
  ((cond) ? ((void)0) : ::ebus::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // EBUS_PLATFORM_HPP_
