/**
 * @file platform.hpp
 * @brief Cache line size, assertion and time helpers.
 */

#ifndef IODRV_PLATFORM_HPP_
#define IODRV_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace iodrv {

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "IODRV_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define IODRV_ASSERT(cond) ((void)0)
#else
#define IODRV_ASSERT(cond) \
  ((cond) ? ((void)0) : ::iodrv::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Time
// ============================================================================

/// @brief Monotonic timestamp in microseconds.
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

}  // namespace iodrv

#endif  // IODRV_PLATFORM_HPP_
