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
 * @file transport.hpp
 * @brief Framed message connection over one stream socket.
 *
 * Send() is serialised by an internal mutex so several threads may write.
 * Receive()/Pump() must be driven by a single reader thread.
 */

#ifndef NGW_TRANSPORT_HPP_
#define NGW_TRANSPORT_HPP_

#include "ngw/frame.hpp"
#include "ngw/log.hpp"
#include "ngw/socket.hpp"

#if NGW_HAS_NETWORK

#include <atomic>
#include <deque>
#include <mutex>

namespace ngw {

class FramedConnection {
 public:
  static constexpr size_t kRecvChunk = 4096;
  /// Longest a single frame write may wait on a peer that is not reading.
  static constexpr int32_t kDefaultSendTimeoutMs = 5000;

  FramedConnection() = default;
  explicit FramedConnection(TcpSocket sock) noexcept : sock_(std::move(sock)) {}

  FramedConnection(const FramedConnection&) = delete;
  FramedConnection& operator=(const FramedConnection&) = delete;

  /**
   * @brief Encode and write one whole frame.
   * @return kConnectionLost on I/O failure or when the peer has not taken
   *         the frame within the send timeout, kProtocolViolation if the
   *         message cannot be encoded.
   */
  expected<void, NodeError> Send(const Message& msg) {
    auto frame = FrameCodec::Encode(msg);
    if (!frame.has_value()) {
      NGW_LOG_WARN("Session", "encode failed: %s", ToString(frame.get_error()));
      return expected<void, NodeError>::error(NodeError::kProtocolViolation);
    }
    std::lock_guard<std::mutex> lock(send_mtx_);
    auto r = sock_.SendAll(frame.value().data(), frame.value().size(),
                           send_timeout_ms_.load(std::memory_order_relaxed));
    if (!r.has_value()) {
      if (r.get_error() == SocketError::kTimeout) {
        NGW_LOG_WARN("Session", "fd %d: peer stopped reading, write timed out", sock_.Fd());
      }
      return expected<void, NodeError>::error(NodeError::kConnectionLost);
    }
    return expected<void, NodeError>::success();
  }

  /**
   * @brief Read whatever is available (one recv) and queue decoded messages.
   *
   * Call after poll(2) reports the fd readable.
   * @return kConnectionLost on EOF or I/O error, kProtocolViolation on a
   *         malformed frame.
   */
  expected<void, NodeError> Pump() {
    uint8_t buf[kRecvChunk];
    auto n = sock_.Recv(buf, sizeof(buf));
    if (!n.has_value()) {
      if (n.get_error() == SocketError::kWouldBlock) {
        return expected<void, NodeError>::success();
      }
      return expected<void, NodeError>::error(NodeError::kConnectionLost);
    }
    if (n.value() == 0) {
      return expected<void, NodeError>::error(NodeError::kConnectionLost);
    }
    decoder_.Feed(buf, static_cast<size_t>(n.value()));

    Message msg;
    for (;;) {
      auto got = decoder_.Next(msg);
      if (!got.has_value()) {
        NGW_LOG_WARN("Session", "malformed frame on fd %d: %s", sock_.Fd(),
                     ToString(got.get_error()));
        return expected<void, NodeError>::error(NodeError::kProtocolViolation);
      }
      if (!got.value()) break;
      inbox_.push_back(std::move(msg));
    }
    return expected<void, NodeError>::success();
  }

  /** @brief Pop one message queued by Pump(). */
  bool PopQueued(Message& out) {
    if (inbox_.empty()) return false;
    out = std::move(inbox_.front());
    inbox_.pop_front();
    return true;
  }

  /**
   * @brief Block up to @p timeout_ms for the next message.
   * @return kTimeout when nothing complete arrived in time.
   */
  expected<Message, NodeError> Receive(int32_t timeout_ms) {
    using R = expected<Message, NodeError>;
    const uint64_t deadline = SteadyNowMs() + static_cast<uint64_t>(timeout_ms);
    Message msg;
    for (;;) {
      if (PopQueued(msg)) return R::success(std::move(msg));

      const uint64_t now = SteadyNowMs();
      if (now >= deadline) return R::error(NodeError::kTimeout);

      pollfd pfd{sock_.Fd(), POLLIN, 0};
      int32_t pr = ::poll(&pfd, 1, static_cast<int32_t>(deadline - now));
      if (pr < 0 && errno == EINTR) continue;
      if (pr < 0) return R::error(NodeError::kConnectionLost);
      if (pr == 0) return R::error(NodeError::kTimeout);

      auto pumped = Pump();
      if (!pumped.has_value()) return R::error(pumped.get_error());
    }
  }

  /** @brief Bound every later Send(); negative means no limit. */
  void SetSendTimeout(int32_t timeout_ms) noexcept {
    send_timeout_ms_.store(timeout_ms, std::memory_order_relaxed);
  }

  /**
   * @brief Wake a blocked reader or writer and refuse further I/O.
   *
   * Safe from any thread, including while another thread is in Send().
   */
  void Shutdown() {
    std::lock_guard<std::mutex> lock(fd_mtx_);
    sock_.ShutdownBoth();
  }

  /**
   * @brief Release the fd. Waits for a Send() in progress on another
   *        thread, so the fd number cannot be reused under it.
   */
  void Close() {
    Shutdown();
    std::lock_guard<std::mutex> send_lock(send_mtx_);
    std::lock_guard<std::mutex> fd_lock(fd_mtx_);
    sock_.Close();
  }

  int32_t Fd() const noexcept { return sock_.Fd(); }
  bool IsOpen() const noexcept { return sock_.IsValid(); }

 private:
  TcpSocket sock_;
  FrameDecoder decoder_;
  std::deque<Message> inbox_;
  std::mutex send_mtx_;
  std::mutex fd_mtx_;
  std::atomic<int32_t> send_timeout_ms_{kDefaultSendTimeoutMs};
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_TRANSPORT_HPP_
