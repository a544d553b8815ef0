/**
 * @file log.hpp
 * @brief Leveled, printf-style synchronous logging.
 *
 * One line per call, written under a process-wide mutex:
 *
 *   [2026-10-19 14:33:02.117] WARN  [Driver] message (storage_driver.hpp:212)
 *
 * Output goes to stderr unless a sink function is installed with SetSink().
 *
 * Compile-time configuration:
 *   IODRV_LOG_MIN_LEVEL -- lowest level compiled in (0=DEBUG .. 4=FATAL),
 *                          default 0 in debug builds, 1 with NDEBUG.
 */

#ifndef IODRV_LOG_HPP_
#define IODRV_LOG_HPP_

#include "iodrv/platform.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <atomic>
#include <chrono>
#include <mutex>

#ifndef IODRV_LOG_MIN_LEVEL
#ifdef NDEBUG
#define IODRV_LOG_MIN_LEVEL 1
#else
#define IODRV_LOG_MIN_LEVEL 0
#endif
#endif

namespace iodrv {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

/**
 * @brief Sink receiving one fully formatted line (no trailing newline).
 */
using LogSinkFn = void (*)(Level level, const char* line, void* context);

static constexpr uint32_t kMaxLineLen = 512U;

namespace detail {

struct LogContext {
  std::mutex mtx;
  std::atomic<uint8_t> level{static_cast<uint8_t>(IODRV_LOG_MIN_LEVEL == 0 ? Level::kDebug : Level::kInfo)};
  std::atomic<bool> initialized{false};
  LogSinkFn sink{nullptr};
  void* sink_context{nullptr};
};

inline LogContext& Context() noexcept {
  static LogContext ctx;
  return ctx;
}

inline const char* LevelName(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO ";
    case Level::kWarn:  return "WARN ";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?    ";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format local wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatWallclock(char* buf, size_t size) noexcept {
  const auto now = std::chrono::system_clock::now();
  const std::time_t sec = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  (void)localtime_r(&sec, &tm_buf);
  const size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03d", static_cast<int>(ms));
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::Context().level.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(detail::Context().level.load(std::memory_order_relaxed));
}

/**
 * @brief Route formatted lines to @p sink instead of stderr.
 *
 * Pass nullptr to restore stderr output.
 */
inline void SetSink(LogSinkFn sink, void* context = nullptr) noexcept {
  auto& ctx = detail::Context();
  std::lock_guard<std::mutex> lk(ctx.mtx);
  ctx.sink = sink;
  ctx.sink_context = context;
}

inline void Init() noexcept { detail::Context().initialized.store(true, std::memory_order_release); }

inline void Shutdown() noexcept {
  auto& ctx = detail::Context();
  {
    std::lock_guard<std::mutex> lk(ctx.mtx);
    ctx.sink = nullptr;
    ctx.sink_context = nullptr;
  }
  (void)std::fflush(stderr);
  ctx.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::Context().initialized.load(std::memory_order_acquire);
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char ts[32];
  detail::FormatWallclock(ts, sizeof(ts));

  char msg[kMaxLineLen];
  (void)vsnprintf(msg, sizeof(msg), fmt, args);

  char out[kMaxLineLen + 96U];
  (void)std::snprintf(out, sizeof(out), "[%s] %s [%s] %s (%s:%d)", ts,
                      detail::LevelName(level), (category != nullptr) ? category : "-", msg,
                      detail::Basename(file), line);

  auto& ctx = detail::Context();
  std::lock_guard<std::mutex> lk(ctx.mtx);
  if (ctx.sink != nullptr) {
    ctx.sink(level, out, ctx.sink_context);
  } else {
    (void)std::fprintf(stderr, "%s\n", out);
  }
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace iodrv

// ============================================================================
// Macros
// ============================================================================

#define IODRV_LOG_DEBUG(cat, fmt, ...)                                              \
  do {                                                                              \
    if (IODRV_LOG_MIN_LEVEL <= 0) {                                                 \
      ::iodrv::log::LogWrite(::iodrv::log::Level::kDebug, cat, __FILE__, __LINE__,  \
                             fmt, ##__VA_ARGS__);                                   \
    }                                                                               \
  } while (0)

#define IODRV_LOG_INFO(cat, fmt, ...)                                               \
  do {                                                                              \
    if (IODRV_LOG_MIN_LEVEL <= 1) {                                                 \
      ::iodrv::log::LogWrite(::iodrv::log::Level::kInfo, cat, __FILE__, __LINE__,   \
                             fmt, ##__VA_ARGS__);                                   \
    }                                                                               \
  } while (0)

#define IODRV_LOG_WARN(cat, fmt, ...)                                               \
  do {                                                                              \
    if (IODRV_LOG_MIN_LEVEL <= 2) {                                                 \
      ::iodrv::log::LogWrite(::iodrv::log::Level::kWarn, cat, __FILE__, __LINE__,   \
                             fmt, ##__VA_ARGS__);                                   \
    }                                                                               \
  } while (0)

#define IODRV_LOG_ERROR(cat, fmt, ...)                                              \
  do {                                                                              \
    if (IODRV_LOG_MIN_LEVEL <= 3) {                                                 \
      ::iodrv::log::LogWrite(::iodrv::log::Level::kError, cat, __FILE__, __LINE__,  \
                             fmt, ##__VA_ARGS__);                                   \
    }                                                                               \
  } while (0)

#define IODRV_LOG_FATAL(cat, fmt, ...)                                              \
  do {                                                                              \
    ::iodrv::log::LogWrite(::iodrv::log::Level::kFatal, cat, __FILE__, __LINE__,    \
                           fmt, ##__VA_ARGS__);                                     \
    std::abort();                                                                   \
  } while (0)

#endif  // IODRV_LOG_HPP_
