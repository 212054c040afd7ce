/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros for dlcore.
 */

#ifndef DLCORE_PLATFORM_HPP_
#define DLCORE_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace dlcore {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define DLCORE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define DLCORE_PLATFORM_MACOS 1
#endif

#if defined(DLCORE_PLATFORM_LINUX) || defined(DLCORE_PLATFORM_MACOS)
#define DLCORE_PLATFORM_POSIX 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define DLCORE_LIKELY(x) __builtin_expect(!!(x), 1)
#define DLCORE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define DLCORE_PRINTF_FORMAT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define DLCORE_LIKELY(x) (x)
#define DLCORE_UNLIKELY(x) (x)
#define DLCORE_PRINTF_FORMAT(fmt_idx, arg_idx)
#endif

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
  (void)std::fprintf(stderr, "DLCORE_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define DLCORE_ASSERT(cond) ((void)0)
#else
#define DLCORE_ASSERT(cond) \
  ((cond) ? ((void)0) : ::dlcore::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace dlcore

#endif  // DLCORE_PLATFORM_HPP_
