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
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM to "stop the daemon" bridge for the gateway demo.
 *
 * The signal handler only writes one byte to a self-pipe, which is
 * async-signal-safe. Wait() blocks on the read end.
 */

#ifndef NGW_SHUTDOWN_HPP_
#define NGW_SHUTDOWN_HPP_

#include "ngw/platform.hpp"
#include "ngw/vocabulary.hpp"

#if NGW_HAS_NETWORK

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <signal.h>
#include <unistd.h>

namespace ngw {

enum class ShutdownError : uint8_t {
  kPipeCreationFailed = 0,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

class ShutdownSignal;

namespace detail {

inline ShutdownSignal*& ShutdownInstance() {
  static ShutdownSignal* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief One per process. A second instance is inert and reports
 *        kAlreadyInstantiated.
 */
class ShutdownSignal final {
 public:
  ShutdownSignal() noexcept {
    if (detail::ShutdownInstance() != nullptr) return;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::ShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownSignal() {
    if (detail::ShutdownInstance() == this) detail::ShutdownInstance() = nullptr;
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownSignal(const ShutdownSignal&) = delete;
  ShutdownSignal& operator=(const ShutdownSignal&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Install() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa {};
    sa.sa_handler = &ShutdownSignal::OnSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 || ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /** @brief Request shutdown without a signal (0 is reported as signo). */
  void Trigger(int signo = 0) noexcept { Notify(signo); }

  /** @brief Block until a signal or Trigger(). @return The signal number. */
  int Wait() noexcept {
    while (valid_ && !requested_.load()) {
      uint8_t byte = 0;
      ssize_t n = ::read(pipe_fd_[0], &byte, 1);
      if (n < 0 && errno == EINTR) continue;
      break;
    }
    return signo_.load();
  }

  bool IsRequested() const noexcept { return requested_.load(); }

 private:
  static void OnSignal(int signo) {
    ShutdownSignal* self = detail::ShutdownInstance();
    if (self != nullptr) self->Notify(signo);
  }

  void Notify(int signo) noexcept {
    bool expected_flag = false;
    if (!requested_.compare_exchange_strong(expected_flag, true)) return;
    signo_.store(signo);
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      static_cast<void>(::write(pipe_fd_[1], &byte, 1));
    }
  }

  int pipe_fd_[2] = {-1, -1};
  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  bool valid_ = false;
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_SHUTDOWN_HPP_
