/**
 * @file platform.hpp
 * @brief Platform detection, monotonic clock and assertion macro.
 */

#ifndef OFFLOAD_PLATFORM_HPP_
#define OFFLOAD_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace offload {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define OFFLOAD_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define OFFLOAD_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define OFFLOAD_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Monotonic Clock
// ============================================================================

/// @brief Steady clock in microseconds (monotonic, not wall time).
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// @brief Steady clock in nanoseconds.
inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

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
  (void)std::fprintf(stderr, "OFFLOAD_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define OFFLOAD_ASSERT(cond) ((void)0)
#else
#define OFFLOAD_ASSERT(cond) \
  ((cond) ? ((void)0) : ::offload::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace offload

#endif  // OFFLOAD_PLATFORM_HPP_
