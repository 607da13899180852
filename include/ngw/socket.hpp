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
 * @file socket.hpp
 * @brief Stream sockets for the gateway and the agent.
 *
 * TcpSocket, TcpListener and WakePipe each own their descriptors through
 * detail::UniqueFd. Failures come back as ngw::expected<V, SocketError>;
 * nothing here logs.
 */

#ifndef NGW_SOCKET_HPP_
#define NGW_SOCKET_HPP_

#include "ngw/platform.hpp"
#include "ngw/vocabulary.hpp"

#if NGW_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace ngw {

constexpr int32_t kListenBacklog = 64;

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kBadAddress,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kTimeout,
  kWouldBlock  ///< EAGAIN: nothing to read right now.
};

namespace detail {

/** @brief Move-only owner of one file descriptor. */
class UniqueFd {
 public:
  UniqueFd() noexcept = default;
  explicit UniqueFd(int32_t fd) noexcept : fd_(fd) {}
  ~UniqueFd() { Reset(); }

  UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) Reset(other.Release());
    return *this;
  }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int32_t Get() const noexcept { return fd_; }
  bool Valid() const noexcept { return fd_ >= 0; }

  int32_t Release() noexcept {
    const int32_t fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Reset(int32_t fd = -1) noexcept {
    if (fd_ >= 0) static_cast<void>(::close(fd_));
    fd_ = fd;
  }

 private:
  int32_t fd_ = -1;
};

/** @brief Turn O_NONBLOCK on or off. @return Previous flags, or -1. */
inline int32_t SetNonBlocking(int32_t fd, bool enable) noexcept {
  const int32_t flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return -1;
  const int32_t wanted = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (wanted != flags && ::fcntl(fd, F_SETFL, wanted) < 0) return -1;
  return flags;
}

inline expected<void, SocketError> SetIntOption(int32_t fd, int32_t level, int32_t name,
                                                int32_t value) noexcept {
  if (fd < 0) return expected<void, SocketError>::error(SocketError::kInvalidFd);
  if (::setsockopt(fd, level, name, &value, static_cast<socklen_t>(sizeof(value))) < 0) {
    return expected<void, SocketError>::error(SocketError::kSetOptFailed);
  }
  return expected<void, SocketError>::success();
}

}  // namespace detail

// ============================================================================
// SocketAddress
// ============================================================================

/** @brief IPv4 endpoint (sockaddr_in). */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /** @return kBadAddress unless @p ip is a dotted-decimal literal. */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    using R = expected<SocketAddress, SocketError>;
    SocketAddress out;
    out.addr_.sin_family = AF_INET;
    out.addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip, &out.addr_.sin_addr) != 1) {
      return R::error(SocketError::kBadAddress);
    }
    return R::success(out);
  }

  /** @brief Literal first, then the resolver; the first IPv4 answer wins. */
  static expected<SocketAddress, SocketError> Resolve(const char* host,
                                                      uint16_t port) noexcept {
    using R = expected<SocketAddress, SocketError>;
    auto literal = FromIpv4(host, port);
    if (literal.has_value()) return literal;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &found) != 0 || found == nullptr) {
      return R::error(SocketError::kBadAddress);
    }
    SocketAddress out;
    std::memcpy(&out.addr_, found->ai_addr, sizeof(out.addr_));
    ::freeaddrinfo(found);
    out.addr_.sin_port = htons(port);
    return R::success(out);
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /** @brief Dotted-decimal host part; empty string on failure. */
  void FormatIp(char* buf, socklen_t len) const noexcept {
    if (len == 0) return;
    if (::inet_ntop(AF_INET, &addr_.sin_addr, buf, len) == nullptr) buf[0] = '\0';
  }

 private:
  friend class TcpSocket;
  friend class TcpListener;

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* AsSockaddr() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* AsSockaddr() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }
  static socklen_t Length() noexcept { return static_cast<socklen_t>(sizeof(sockaddr_in)); }

  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief Connected (or connecting) stream socket.
 *
 * Adopt() also wraps AF_UNIX fds from socketpair(2), which the tests use
 * as an in-process link.
 */
class TcpSocket {
 public:
  TcpSocket() noexcept = default;
  TcpSocket(TcpSocket&&) noexcept = default;
  TcpSocket& operator=(TcpSocket&&) noexcept = default;

  static expected<TcpSocket, SocketError> Create() noexcept {
    using R = expected<TcpSocket, SocketError>;
    const int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return R::error(SocketError::kInvalidFd);
    return R::success(Adopt(fd));
  }

  static TcpSocket Adopt(int32_t fd) noexcept {
    TcpSocket s;
    s.fd_.Reset(fd);
    return s;
  }

  /**
   * @brief Non-blocking connect bounded by @p timeout_ms; the socket is
   *        blocking again afterwards.
   */
  expected<void, SocketError> Connect(const SocketAddress& addr, int32_t timeout_ms) noexcept {
    using R = expected<void, SocketError>;
    const int32_t fd = fd_.Get();
    if (fd < 0) return R::error(SocketError::kInvalidFd);
    if (detail::SetNonBlocking(fd, true) < 0) return R::error(SocketError::kSetOptFailed);

    SocketError failure = SocketError::kConnectFailed;
    bool ok = ::connect(fd, addr.AsSockaddr(), SocketAddress::Length()) == 0;
    if (!ok && errno == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      if (::poll(&pfd, 1, timeout_ms) <= 0) {
        failure = SocketError::kTimeout;
      } else {
        int32_t so_error = 0;
        socklen_t len = sizeof(so_error);
        ok = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0;
      }
    }

    if (detail::SetNonBlocking(fd, false) < 0 && ok) {
      return R::error(SocketError::kSetOptFailed);
    }
    return ok ? R::success() : R::error(failure);
  }

  /**
   * @brief Write the whole buffer; short writes and EINTR are retried.
   *
   * Never blocks in the kernel: a full send buffer is waited out with
   * poll(2) until @p timeout_ms has passed since the call (negative means
   * no limit), after which kTimeout is returned with the frame cut short.
   */
  expected<void, SocketError> SendAll(const void* data, size_t len,
                                      int32_t timeout_ms = -1) noexcept {
    using R = expected<void, SocketError>;
    const auto* cursor = static_cast<const uint8_t*>(data);
    const uint64_t deadline =
        (timeout_ms < 0) ? 0 : SteadyNowMs() + static_cast<uint64_t>(timeout_ms);
    while (len > 0) {
      if (!fd_.Valid()) return R::error(SocketError::kInvalidFd);
      const ssize_t n = ::send(fd_.Get(), cursor, len, MSG_NOSIGNAL | MSG_DONTWAIT);
      if (n >= 0) {
        cursor += n;
        len -= static_cast<size_t>(n);
        continue;
      }
      if (errno == EINTR) continue;
      if (errno != EAGAIN && errno != EWOULDBLOCK) return R::error(SocketError::kSendFailed);

      int32_t slice = 100;
      if (deadline != 0) {
        const uint64_t now = SteadyNowMs();
        if (now >= deadline) return R::error(SocketError::kTimeout);
        if (deadline - now < static_cast<uint64_t>(slice)) {
          slice = static_cast<int32_t>(deadline - now);
        }
      }
      pollfd pfd{fd_.Get(), POLLOUT, 0};
      static_cast<void>(::poll(&pfd, 1, slice));
    }
    return R::success();
  }

  /** @return Bytes read; 0 means the peer closed its end. */
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    using R = expected<int32_t, SocketError>;
    if (!fd_.Valid()) return R::error(SocketError::kInvalidFd);
    ssize_t n = -1;
    do {
      n = ::recv(fd_.Get(), buf, len, 0);
    } while (n < 0 && errno == EINTR);
    if (n >= 0) return R::success(static_cast<int32_t>(n));
    return R::error((errno == EAGAIN || errno == EWOULDBLOCK) ? SocketError::kWouldBlock
                                                              : SocketError::kRecvFailed);
  }

  /** @brief Disable Nagle. Fails harmlessly on AF_UNIX sockets. */
  expected<void, SocketError> SetNoDelay(bool enable) noexcept {
    return detail::SetIntOption(fd_.Get(), IPPROTO_TCP, TCP_NODELAY, enable ? 1 : 0);
  }

  /** @brief shutdown(SHUT_RDWR): wakes a reader blocked on this fd. */
  void ShutdownBoth() noexcept {
    if (fd_.Valid()) static_cast<void>(::shutdown(fd_.Get(), SHUT_RDWR));
  }

  void Close() noexcept { fd_.Reset(); }

  int32_t Fd() const noexcept { return fd_.Get(); }
  bool IsValid() const noexcept { return fd_.Valid(); }

 private:
  detail::UniqueFd fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

class TcpListener {
 public:
  TcpListener() noexcept = default;
  TcpListener(TcpListener&&) noexcept = default;
  TcpListener& operator=(TcpListener&&) noexcept = default;

  static expected<TcpListener, SocketError> Create() noexcept {
    using R = expected<TcpListener, SocketError>;
    const int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return R::error(SocketError::kInvalidFd);
    TcpListener l;
    l.fd_.Reset(fd);
    return R::success(std::move(l));
  }

  expected<void, SocketError> SetReuseAddr(bool enable) noexcept {
    return detail::SetIntOption(fd_.Get(), SOL_SOCKET, SO_REUSEADDR, enable ? 1 : 0);
  }

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    using R = expected<void, SocketError>;
    if (!fd_.Valid()) return R::error(SocketError::kInvalidFd);
    if (::bind(fd_.Get(), addr.AsSockaddr(), SocketAddress::Length()) < 0) {
      return R::error(SocketError::kBindFailed);
    }
    return R::success();
  }

  expected<void, SocketError> Listen(int32_t backlog = kListenBacklog) noexcept {
    using R = expected<void, SocketError>;
    if (!fd_.Valid()) return R::error(SocketError::kInvalidFd);
    if (::listen(fd_.Get(), backlog) < 0) return R::error(SocketError::kListenFailed);
    return R::success();
  }

  /**
   * @brief Accept one connection, waiting at most @p timeout_ms.
   * @return kTimeout when nothing arrived, so accept loops can re-check
   *         their running flag.
   */
  expected<TcpSocket, SocketError> Accept(SocketAddress& peer, int32_t timeout_ms) noexcept {
    using R = expected<TcpSocket, SocketError>;
    if (!fd_.Valid()) return R::error(SocketError::kInvalidFd);
    pollfd pfd{fd_.Get(), POLLIN, 0};
    const int32_t ready = ::poll(&pfd, 1, timeout_ms);
    if (ready == 0 || (ready < 0 && errno == EINTR)) return R::error(SocketError::kTimeout);
    if (ready < 0) return R::error(SocketError::kAcceptFailed);

    socklen_t len = SocketAddress::Length();
    const int32_t fd = ::accept(fd_.Get(), peer.AsSockaddr(), &len);
    if (fd < 0) return R::error(SocketError::kAcceptFailed);
    return R::success(TcpSocket::Adopt(fd));
  }

  /** @brief Bound port; the way to learn it after binding port 0. */
  uint16_t LocalPort() const noexcept {
    SocketAddress local;
    socklen_t len = SocketAddress::Length();
    if (!fd_.Valid() || ::getsockname(fd_.Get(), local.AsSockaddr(), &len) < 0) return 0;
    return local.Port();
  }

  void Close() noexcept { fd_.Reset(); }

  int32_t Fd() const noexcept { return fd_.Get(); }
  bool IsValid() const noexcept { return fd_.Valid(); }

 private:
  detail::UniqueFd fd_;
};

// ============================================================================
// WakePipe
// ============================================================================

/**
 * @brief Self-pipe that interrupts a poll(2) from another thread.
 *
 * The owner polls ReadFd() and calls Drain() once it turns readable.
 */
class WakePipe {
 public:
  WakePipe() noexcept {
    int32_t fds[2] = {-1, -1};
    if (::pipe(fds) != 0) return;
    read_.Reset(fds[0]);
    write_.Reset(fds[1]);
    static_cast<void>(detail::SetNonBlocking(fds[0], true));
    static_cast<void>(detail::SetNonBlocking(fds[1], true));
  }

  WakePipe(const WakePipe&) = delete;
  WakePipe& operator=(const WakePipe&) = delete;

  bool IsValid() const noexcept { return read_.Valid(); }
  int32_t ReadFd() const noexcept { return read_.Get(); }

  void Notify() noexcept {
    if (!write_.Valid()) return;
    const uint8_t one = 1;
    // EAGAIN means the pipe is full, so a wakeup is already pending.
    static_cast<void>(::write(write_.Get(), &one, 1));
  }

  void Drain() noexcept {
    if (!read_.Valid()) return;
    uint8_t sink[64];
    while (::read(read_.Get(), sink, sizeof(sink)) > 0) {
    }
  }

 private:
  detail::UniqueFd read_;
  detail::UniqueFd write_;
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_SOCKET_HPP_
