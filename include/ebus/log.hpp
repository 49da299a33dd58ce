/**
 * @file log.hpp
 * @brief Synchronous printf-style logging with a replaceable process sink.
 *
 * Every record carries a level, a short category ("conn", "router", ...),
 * the formatted message and the call site. Records below the runtime level
 * (GetLevel/SetLevel) or the compile-time floor EBUS_LOG_MIN_LEVEL are
 * discarded before formatting.
 *
 * The default sink writes one line per record to stderr:
 *   [2024-01-01 12:00:00.000] [WARN] [conn] message (file.hpp:42)
 *
 * @code
 *   ebus::log::Init();
 *   EBUS_LOG_INFO("conn", "opened %s", address);
 * @endcode
 */

#ifndef EBUS_LOG_HPP_
#define EBUS_LOG_HPP_

#include "ebus/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#include <time.h>

// 0=DEBUG 1=INFO 2=WARN 3=ERROR 4=FATAL
#ifndef EBUS_LOG_MIN_LEVEL
#define EBUS_LOG_MIN_LEVEL 0
#endif

#ifndef EBUS_LOG_MESSAGE_MAX
#define EBUS_LOG_MESSAGE_MAX 512U
#endif

namespace ebus {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/**
 * @brief Log sink: receives fully formatted records.
 *
 * Called with the sink mutex held; records from concurrent threads are
 * delivered one at a time.
 */
using SinkFn = void (*)(Level level, const char* category, const char* message,
                        const char* file, int line, void* ctx);

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

struct SinkState {
  std::mutex mutex;
  SinkFn fn = nullptr;
  void* ctx = nullptr;
  bool initialized = false;
};

inline SinkState& Sink() noexcept {
  static SinkState state;
  return state;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  time_t t = ts.tv_sec;
  struct tm tm_local;
  localtime_r(&t, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
}

inline void StderrSink(Level level, const char* category, const char* message,
                       const char* file, int line, void* /*ctx*/) noexcept {
  char ts_buf[32];
  FormatTimestamp(ts_buf, sizeof(ts_buf));
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf, LevelTag(level),
                     category, message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     LevelTag(level), category, message, Basename(file), line);
#endif
}

}  // namespace detail

// ============================================================================
// Level Control
// ============================================================================

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline bool IsEnabled(Level level) noexcept {
  return static_cast<uint8_t>(level) >= static_cast<uint8_t>(GetLevel()) &&
         level != Level::kOff;
}

// ============================================================================
// Lifecycle and Sink
// ============================================================================

inline void Init() {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  sink.initialized = true;
}

/** @brief Marks the logger uninitialized and restores the stderr sink. */
inline void Shutdown() {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  (void)std::fflush(stderr);
  sink.fn = nullptr;
  sink.ctx = nullptr;
  sink.initialized = false;
}

inline bool IsInitialized() {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  return sink.initialized;
}

/** @brief Replaces the process sink; nullptr restores stderr. */
inline void SetSink(SinkFn fn, void* ctx = nullptr) {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  sink.fn = fn;
  sink.ctx = ctx;
}

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) {
  if (!IsEnabled(level)) return;

  char message[EBUS_LOG_MESSAGE_MAX];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  if (sink.fn != nullptr) {
    sink.fn(level, category, message, file, line, sink.ctx);
  } else {
    detail::StderrSink(level, category, message, file, line, nullptr);
  }
}

EBUS_PRINTF_FORMAT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace ebus

// ============================================================================
// Macros
// ============================================================================

#define EBUS_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                      \
    if (EBUS_LOG_MIN_LEVEL <= 0) {                                          \
      ::ebus::log::LogWrite(::ebus::log::Level::kDebug, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define EBUS_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                      \
    if (EBUS_LOG_MIN_LEVEL <= 1) {                                          \
      ::ebus::log::LogWrite(::ebus::log::Level::kInfo, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define EBUS_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                      \
    if (EBUS_LOG_MIN_LEVEL <= 2) {                                          \
      ::ebus::log::LogWrite(::ebus::log::Level::kWarn, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define EBUS_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                      \
    if (EBUS_LOG_MIN_LEVEL <= 3) {                                          \
      ::ebus::log::LogWrite(::ebus::log::Level::kError, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define EBUS_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                      \
    ::ebus::log::LogWrite(::ebus::log::Level::kFatal, cat, __FILE__,        \
                          __LINE__, fmt, ##__VA_ARGS__);                    \
    std::abort();                                                           \
  } while (0)

#endif  // EBUS_LOG_HPP_
