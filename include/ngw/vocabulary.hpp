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
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every ngw module.
 *
 * expected<V, E>  -- value-or-error return type (no exceptions).
 * optional<T>     -- maybe-value for lookups.
 * Clock helpers   -- monotonic and wall-clock timestamps.
 */

#ifndef NGW_VOCABULARY_HPP_
#define NGW_VOCABULARY_HPP_

#include "ngw/platform.hpp"

#include <chrono>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace ngw {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the success()/error() factories so the intent of
 * every return statement is explicit at the call site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.value)) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.value)) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) {
    expected r;
    r.storage_.err = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      expected tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value)) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    NGW_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& noexcept {
    NGW_ASSERT(has_value_);
    return storage_.value;
  }

  E get_error() const noexcept {
    NGW_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  expected() noexcept : has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
      has_value_ = false;
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/** @brief Specialization for operations that only report success or failure. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  E get_error() const noexcept {
    NGW_ASSERT(!ok_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : ok_(ok), err_(e) {}

  bool ok_;
  E err_;
};

// ============================================================================
// optional<T>
// ============================================================================

/** @brief Maybe-value used by registry lookups and config getters. */
template <typename T>
class optional final {
 public:
  optional() noexcept : engaged_(false) {}

  optional(const T& v) : engaged_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&storage_.value)) T(v);
  }

  optional(T&& v) : engaged_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&storage_.value)) T(std::move(v));
  }

  optional(const optional& other) : engaged_(other.engaged_) {
    if (engaged_) ::new (static_cast<void*>(&storage_.value)) T(other.storage_.value);
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : engaged_(other.engaged_) {
    if (engaged_) {
      ::new (static_cast<void*>(&storage_.value)) T(std::move(other.storage_.value));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      optional tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      engaged_ = other.engaged_;
      if (engaged_) {
        ::new (static_cast<void*>(&storage_.value)) T(std::move(other.storage_.value));
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return engaged_; }
  explicit operator bool() const noexcept { return engaged_; }

  T& value() noexcept {
    NGW_ASSERT(engaged_);
    return storage_.value;
  }
  const T& value() const noexcept {
    NGW_ASSERT(engaged_);
    return storage_.value;
  }

  T value_or(const T& fallback) const {
    return engaged_ ? storage_.value : fallback;
  }

  void reset() noexcept {
    if (engaged_) {
      storage_.value.~T();
      engaged_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    T value;
  } storage_;
  bool engaged_;
};

// ============================================================================
// Clock Helpers
// ============================================================================

/** @brief Monotonic timestamp in nanoseconds. */
inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/** @brief Monotonic timestamp in microseconds. */
inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000U; }

/** @brief Monotonic timestamp in milliseconds. */
inline uint64_t SteadyNowMs() noexcept { return SteadyNowNs() / 1000000U; }

/** @brief Wall-clock milliseconds since the Unix epoch (for display only). */
inline uint64_t WallNowMs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace ngw

#endif  // NGW_VOCABULARY_HPP_
