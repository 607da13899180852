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
 * @brief Synchronous category logger with printf-style macros.
 *
 * Output format (stderr):
 *   [2026-10-18 14:02:11.042] [INFO ] [Session] node 3f2a... active (session.hpp:412)
 *
 * Compile-time floor: NGW_LOG_MIN_LEVEL (0=debug .. 5=off). Calls below the
 * floor compile to nothing; calls above it are filtered at runtime against
 * the level set with SetLevel().
 */

#ifndef NGW_LOG_HPP_
#define NGW_LOG_HPP_

#include "ngw/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <sys/time.h>

#ifndef NGW_LOG_MIN_LEVEL
#define NGW_LOG_MIN_LEVEL 0
#endif

namespace ngw {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

struct LogState {
#ifdef NDEBUG
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  std::atomic<bool> initialized{false};
  std::mutex write_mutex;
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO ";
    case Level::kWarn:  return "WARN ";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF  ";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(detail::State().level.load(std::memory_order_relaxed));
}

inline void Init() noexcept {
  detail::State().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::State().initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) return;

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  timeval tv{};
  ::gettimeofday(&tv, nullptr);
  std::tm tm_buf{};
  time_t secs = tv.tv_sec;
  ::localtime_r(&secs, &tm_buf);
  char stamp[32];
  (void)std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::lock_guard<std::mutex> lock(detail::State().write_mutex);
  (void)std::fprintf(stderr, "[%s.%03ld] [%s] [%s] %s (%s:%d)\n", stamp,
                     static_cast<long>(tv.tv_usec / 1000), detail::LevelTag(level),
                     category, message, detail::Basename(file), line);
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

}  // namespace log
}  // namespace ngw

// ============================================================================
// Macros
// ============================================================================

#define NGW_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                      \
    if (NGW_LOG_MIN_LEVEL <= 0) {                                           \
      ::ngw::log::LogWrite(::ngw::log::Level::kDebug, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define NGW_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                      \
    if (NGW_LOG_MIN_LEVEL <= 1) {                                           \
      ::ngw::log::LogWrite(::ngw::log::Level::kInfo, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define NGW_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                      \
    if (NGW_LOG_MIN_LEVEL <= 2) {                                           \
      ::ngw::log::LogWrite(::ngw::log::Level::kWarn, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define NGW_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                      \
    if (NGW_LOG_MIN_LEVEL <= 3) {                                           \
      ::ngw::log::LogWrite(::ngw::log::Level::kError, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define NGW_LOG_FATAL(cat, fmt, ...)                                        \
  ::ngw::log::LogWrite(::ngw::log::Level::kFatal, cat, __FILE__, __LINE__,  \
                       fmt, ##__VA_ARGS__)

#endif  // NGW_LOG_HPP_
