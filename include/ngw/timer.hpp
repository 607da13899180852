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
 * @file timer.hpp
 * @brief Periodic task scheduler driving the gateway's housekeeping sweeps.
 */

#ifndef NGW_TIMER_HPP_
#define NGW_TIMER_HPP_

#include "ngw/platform.hpp"
#include "ngw/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace ngw {

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kNotFound,
  kAlreadyRunning,
};

/**
 * @brief Plain function pointer invoked on each period tick.
 * @param ctx User-supplied context (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

using TimerTaskId = uint32_t;

// ============================================================================
// TimerScheduler
// ============================================================================

/**
 * @brief Fixed-capacity periodic scheduler with one background thread.
 *
 * Callbacks run on the scheduler thread, outside the slot lock, so a
 * callback may call Add()/Remove(). Stop() wakes the thread immediately.
 *
 *   ngw::TimerScheduler sched(4);
 *   sched.Add(30000, &SweepCodes, &issuer);
 *   sched.Start();
 */
class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 8) : slots_(max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;

  /**
   * @brief Register a periodic task. First fire is one period from now.
   * @return kInvalidPeriod for period 0, kSlotsFull when out of slots.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidPeriod);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active) continue;
      slot.fn = fn;
      slot.ctx = ctx;
      slot.period_ms = period_ms;
      slot.next_fire_ms = SteadyNowMs() + period_ms;
      slot.id = next_id_++;
      slot.active = true;
      cv_.notify_all();
      return expected<TimerTaskId, TimerError>::success(slot.id);
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  expected<void, TimerError> Remove(TimerTaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == id) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotFound);
  }

  expected<void, TimerError> Start() {
    bool expected_running = false;
    if (!running_.compare_exchange_strong(expected_running, true)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /** @brief Stop and join. Safe to call when not running. */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
      cv_.notify_all();
    }
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const auto& slot : slots_) {
      if (slot.active) ++count;
    }
    return count;
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_ms = 0;
    uint64_t next_fire_ms = 0;  ///< Steady clock.
    TimerTaskId id = 0;
    bool active = false;
  };

  struct Due {
    TimerTaskFn fn;
    void* ctx;
  };

  void ScheduleLoop() {
    std::vector<Due> due;
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      const uint64_t now = SteadyNowMs();
      uint64_t next_wake = now + 100U;
      due.clear();
      for (auto& slot : slots_) {
        if (!slot.active) continue;
        if (now >= slot.next_fire_ms) {
          due.push_back(Due{slot.fn, slot.ctx});
          // Skip missed periods rather than firing a burst.
          while (slot.next_fire_ms <= now) slot.next_fire_ms += slot.period_ms;
        }
        if (slot.next_fire_ms < next_wake) next_wake = slot.next_fire_ms;
      }

      if (!due.empty()) {
        lock.unlock();
        for (const auto& d : due) d.fn(d.ctx);
        lock.lock();
        continue;
      }

      cv_.wait_for(lock, std::chrono::milliseconds(next_wake - now));
    }
  }

  std::vector<TaskSlot> slots_;
  TimerTaskId next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace ngw

#endif  // NGW_TIMER_HPP_
