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
 * @file platform.hpp
 * @brief Platform detection and the assertion macro.
 */

#ifndef NGW_PLATFORM_HPP_
#define NGW_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace ngw {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define NGW_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define NGW_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define NGW_PLATFORM_WINDOWS 1
#endif

// Sockets, poll(2) and pipe(2) are required by the gateway and the agent.
#if defined(NGW_PLATFORM_LINUX) || defined(NGW_PLATFORM_MACOS)
#define NGW_HAS_NETWORK 1
#else
#define NGW_HAS_NETWORK 0
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
  (void)std::fprintf(stderr, "NGW_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define NGW_ASSERT(cond) ((void)0)
#else
#define NGW_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::ngw::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace ngw

#endif  // NGW_PLATFORM_HPP_
