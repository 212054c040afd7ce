/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file log.hpp
 * @brief Lightweight printf-style logging for dlcore.
 *
 * Messages carry a level, a category (component name) and the call site.
 * The default sink writes one line per message to stderr; SetSink() redirects
 * output (the tests capture warnings this way).
 *
 * Two filters apply:
 *   - DLCORE_LOG_MIN_LEVEL (compile time, 0 = debug ... 5 = off)
 *   - SetLevel()           (runtime)
 *
 * Usage:
 * @code
 *   dlcore::log::SetLevel(dlcore::log::Level::kInfo);
 *   DLCORE_LOG_INFO("Dispatcher", "dispatched %u jobs", count);
 * @endcode
 */

#ifndef DLCORE_LOG_HPP_
#define DLCORE_LOG_HPP_

#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#ifndef DLCORE_LOG_MIN_LEVEL
#define DLCORE_LOG_MIN_LEVEL 0
#endif

#ifndef DLCORE_LOG_MAX_MESSAGE
#define DLCORE_LOG_MAX_MESSAGE 512U
#endif

namespace dlcore {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

inline const char* LevelName(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff:   return "OFF";
  }
  return "?";
}

/**
 * @brief Parse a level name ("debug", "INFO", "warning", "off", ...).
 * @return The level, or an empty optional for unknown names.
 */
inline optional<Level> ParseLevel(const char* name) noexcept {
  if (name == nullptr) return {};
  char lower[16];
  uint32_t i = 0;
  for (; name[i] != '\0' && i < sizeof(lower) - 1U; ++i) {
    const char c = name[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  lower[i] = '\0';
  if (std::strcmp(lower, "debug") == 0) return Level::kDebug;
  if (std::strcmp(lower, "info") == 0) return Level::kInfo;
  if (std::strcmp(lower, "warn") == 0 || std::strcmp(lower, "warning") == 0)
    return Level::kWarn;
  if (std::strcmp(lower, "error") == 0) return Level::kError;
  if (std::strcmp(lower, "fatal") == 0) return Level::kFatal;
  if (std::strcmp(lower, "off") == 0 || std::strcmp(lower, "none") == 0)
    return Level::kOff;
  return {};
}

/**
 * @brief Output hook. Receives the formatted message without decoration.
 */
using SinkFn = void (*)(Level level, const char* category, const char* message,
                        void* ctx);

// ============================================================================
// Detail: process-wide logger state
// ============================================================================

namespace detail {

struct LogState {
#ifdef NDEBUG
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  std::atomic<bool> initialized{false};
  std::mutex mutex;  ///< Serializes sink swaps and line output.
  SinkFn sink = nullptr;
  void* sink_ctx = nullptr;
};

inline LogState& State() {
  static LogState state;
  return state;
}

inline void WriteStderr(Level level, const char* category, const char* file,
                        int line, const char* message) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  std::tm tm_buf{};
  (void)localtime_r(&secs, &tm_buf);
  char stamp[32];
  (void)std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

  // Strip the directory part of __FILE__.
  const char* base = file;
  for (const char* p = file; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }

  (void)std::fprintf(stderr, "[%s.%03d] [%-5s] [%s] %s (%s:%d)\n", stamp,
                     static_cast<int>(ms), LevelName(level), category, message,
                     base, line);
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::State().level.load(std::memory_order_relaxed));
}

/**
 * @brief Mark the logger initialized and apply the initial level.
 *
 * Logging works without Init(); Init() only makes the level explicit.
 */
inline void Init(Level level = GetLevel()) noexcept {
  SetLevel(level);
  detail::State().initialized.store(true, std::memory_order_release);
}

/**
 * @brief Flush stderr, drop any installed sink, mark uninitialized.
 */
inline void Shutdown() noexcept {
  detail::LogState& s = detail::State();
  {
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sink = nullptr;
    s.sink_ctx = nullptr;
  }
  (void)std::fflush(stderr);
  s.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

/**
 * @brief Redirect output to @p fn. Pass nullptr to restore stderr.
 */
inline void SetSink(SinkFn fn, void* ctx = nullptr) noexcept {
  detail::LogState& s = detail::State();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.sink = fn;
  s.sink_ctx = ctx;
}

inline bool IsEnabled(Level level) noexcept {
  return static_cast<uint8_t>(level) >=
             detail::State().level.load(std::memory_order_relaxed) &&
         level != Level::kOff;
}

/**
 * @brief Format and emit one message. Called through the DLCORE_LOG_* macros.
 */
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) DLCORE_PRINTF_FORMAT(5, 6);

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) {
  if (!IsEnabled(level)) return;

  char message[DLCORE_LOG_MAX_MESSAGE];
  va_list args;
  va_start(args, fmt);
  (void)std::vsnprintf(message, sizeof(message), fmt, args);
  va_end(args);

  detail::LogState& s = detail::State();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.sink != nullptr) {
    s.sink(level, category, message, s.sink_ctx);
  } else {
    detail::WriteStderr(level, category, file, line, message);
  }
}

}  // namespace log
}  // namespace dlcore

// ============================================================================
// Logging Macros
// ============================================================================

#define DLCORE_LOG_IMPL(lvl, category, ...)                                  \
  do {                                                                       \
    if (static_cast<int>(lvl) >= DLCORE_LOG_MIN_LEVEL) {                     \
      ::dlcore::log::LogWrite(lvl, category, __FILE__, __LINE__, __VA_ARGS__); \
    }                                                                        \
  } while (0)

#define DLCORE_LOG_DEBUG(category, ...) \
  DLCORE_LOG_IMPL(::dlcore::log::Level::kDebug, category, __VA_ARGS__)
#define DLCORE_LOG_INFO(category, ...) \
  DLCORE_LOG_IMPL(::dlcore::log::Level::kInfo, category, __VA_ARGS__)
#define DLCORE_LOG_WARN(category, ...) \
  DLCORE_LOG_IMPL(::dlcore::log::Level::kWarn, category, __VA_ARGS__)
#define DLCORE_LOG_ERROR(category, ...) \
  DLCORE_LOG_IMPL(::dlcore::log::Level::kError, category, __VA_ARGS__)

/// Logs unconditionally at FATAL and terminates the process.
#define DLCORE_LOG_FATAL(category, ...)                                     \
  do {                                                                      \
    ::dlcore::log::LogWrite(::dlcore::log::Level::kFatal, category,         \
                            __FILE__, __LINE__, __VA_ARGS__);               \
    (void)std::fflush(stderr);                                              \
    std::abort();                                                           \
  } while (0)

#endif  // DLCORE_LOG_HPP_
