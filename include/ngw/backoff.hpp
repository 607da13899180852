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
 * @file backoff.hpp
 * @brief Exponential backoff and the readiness retry contract.
 *
 * Every component that waits on an asynchronous readiness condition (agent
 * reconnects, Gateway::WaitUntilConnected, external health pollers) uses
 * the same policy: start 500 ms, double, cap 4 s.
 */

#ifndef NGW_BACKOFF_HPP_
#define NGW_BACKOFF_HPP_

#include "ngw/platform.hpp"
#include "ngw/vocabulary.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

namespace ngw {

struct BackoffPolicy {
  uint32_t initial_ms = 500;
  uint32_t multiplier = 2;
  uint32_t cap_ms = 4000;
};

/**
 * @brief Stateful delay generator: 500, 1000, 2000, 4000, 4000, ...
 */
class Backoff {
 public:
  explicit Backoff(const BackoffPolicy& policy = BackoffPolicy{}) noexcept
      : policy_(policy), next_ms_(policy.initial_ms), attempts_(0) {}

  /** @brief Delay to wait before the next attempt. */
  uint32_t Next() noexcept {
    const uint32_t current = std::min(next_ms_, policy_.cap_ms);
    const uint64_t grown = static_cast<uint64_t>(current) *
                           std::max<uint32_t>(policy_.multiplier, 1U);
    next_ms_ = static_cast<uint32_t>(
        std::min<uint64_t>(grown, static_cast<uint64_t>(policy_.cap_ms)));
    ++attempts_;
    return current;
  }

  void Reset() noexcept {
    next_ms_ = policy_.initial_ms;
    attempts_ = 0;
  }

  uint32_t Attempts() const noexcept { return attempts_; }
  const BackoffPolicy& Policy() const noexcept { return policy_; }

 private:
  BackoffPolicy policy_;
  uint32_t next_ms_;
  uint32_t attempts_;
};

/**
 * @brief Poll @p pred with backoff until it holds or @p deadline_ms elapses.
 *
 * The last sleep is shortened so the call never overruns the deadline by
 * more than one predicate evaluation.
 *
 * @return true as soon as the predicate holds, false on deadline.
 */
template <typename Pred>
bool RetryUntil(Pred&& pred, const BackoffPolicy& policy, uint32_t deadline_ms) {
  const uint64_t deadline = SteadyNowMs() + deadline_ms;
  Backoff backoff(policy);
  for (;;) {
    if (pred()) return true;
    const uint64_t now = SteadyNowMs();
    if (now >= deadline) return false;
    const uint64_t delay = std::min<uint64_t>(backoff.Next(), deadline - now);
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
  }
}

}  // namespace ngw

#endif  // NGW_BACKOFF_HPP_
