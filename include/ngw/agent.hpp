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
 * @file agent.hpp
 * @brief Node-side agent: pairs with the gateway, serves commands,
 *        reconnects with its session token.
 *
 * Typical use:
 * @code
 *   ngw::NodeAgent agent(cfg, [](const std::string& p) {
 *     return ngw::CommandResult::Ok(p);
 *   });
 *   auto paired = agent.Pair("482913");
 *   if (paired) agent.Serve();   // blocks until Stop() or a fatal error
 * @endcode
 */

#ifndef NGW_AGENT_HPP_
#define NGW_AGENT_HPP_

#include "ngw/backoff.hpp"
#include "ngw/config.hpp"
#include "ngw/log.hpp"
#include "ngw/transport.hpp"
#include "ngw/types.hpp"

#if NGW_HAS_NETWORK

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ngw {

/// Payload answered by the agent itself when the handler does not claim it.
inline constexpr const char* kPingPayload = "ping";
inline constexpr const char* kPongResult = "pong";

/// Silence from the gateway for this many heartbeat intervals drops the link.
constexpr uint32_t kAgentMissLimit = 3;

/** @brief What a CommandHandler made of one payload. */
struct CommandResult {
  enum class Outcome : uint8_t { kOk = 0, kFailed, kUnhandled };

  Outcome outcome = Outcome::kUnhandled;
  std::string text;  ///< Result on kOk, error message on kFailed.

  static CommandResult Ok(std::string result) {
    return CommandResult{Outcome::kOk, std::move(result)};
  }
  static CommandResult Fail(std::string message) {
    return CommandResult{Outcome::kFailed, std::move(message)};
  }
  static CommandResult Unhandled() { return CommandResult{}; }
};

using CommandHandler = std::function<CommandResult(const std::string& payload)>;

struct PairingResult {
  std::string node_id;
  std::string session_token;
};

enum class AgentState : uint8_t {
  kIdle = 0,
  kPairing,
  kServing,
  kReconnecting,
  kNeedsPairing,
  kStopped,
};

inline const char* ToString(AgentState s) noexcept {
  switch (s) {
    case AgentState::kIdle:         return "idle";
    case AgentState::kPairing:      return "pairing";
    case AgentState::kServing:      return "serving";
    case AgentState::kReconnecting: return "reconnecting";
    case AgentState::kNeedsPairing: return "needs_pairing";
    case AgentState::kStopped:      return "stopped";
  }
  return "unknown";
}

// ============================================================================
// NodeAgent
// ============================================================================

class NodeAgent {
 public:
  NodeAgent(const AgentConfig& cfg, CommandHandler handler)
      : cfg_(cfg), handler_(std::move(handler)) {
    worker_ = std::thread(&NodeAgent::WorkerLoop, this);
  }

  ~NodeAgent() {
    Stop();
    {
      std::lock_guard<std::mutex> lock(job_mtx_);
      worker_exit_ = true;
    }
    job_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
  }

  NodeAgent(const NodeAgent&) = delete;
  NodeAgent& operator=(const NodeAgent&) = delete;

  /**
   * @brief Connect and redeem a one-time pairing code.
   *
   * A Rejected answer is final for that code: the reason is returned and
   * kept in LastRejectReason(), and the code is not retried.
   */
  expected<PairingResult, NodeError> Pair(const std::string& code) {
    using R = expected<PairingResult, NodeError>;
    state_.store(AgentState::kPairing);
    std::shared_ptr<FramedConnection> conn;
    auto resp = Handshake(PairMode::kCode, code, conn);
    if (!resp.has_value()) {
      state_.store(AgentState::kIdle);
      return R::error(resp.get_error());
    }
    const PairingResponse& pr = resp.value();
    if (!pr.accepted) {
      last_reject_.store(pr.reason);
      state_.store(AgentState::kNeedsPairing);
      NGW_LOG_WARN("Agent", "pairing rejected: %s", pr.reason_text.c_str());
      return R::error(pr.reason);
    }

    PairingResult result;
    result.node_id = pr.node_id;
    result.session_token = pr.session_token;
    {
      std::lock_guard<std::mutex> lock(id_mtx_);
      node_id_ = pr.node_id;
      token_ = pr.session_token;
      conn_ = std::move(conn);
    }
    state_.store(AgentState::kServing);
    NGW_LOG_INFO("Agent", "paired as node %s", result.node_id.c_str());
    return R::success(std::move(result));
  }

  /**
   * @brief Serve commands until Stop(), a gateway Close, or a fatal error.
   *
   * Unexpected disconnects are retried with the stored session token.
   * @return success on Stop() or gateway Close; kTokenRejected when the
   *         gateway no longer knows the token (state becomes kNeedsPairing);
   *         kConnectionLost once reconnect attempts are exhausted;
   *         kNotRunning if the agent was never paired.
   */
  expected<void, NodeError> Serve() {
    using R = expected<void, NodeError>;
    if (!IsPaired()) return R::error(NodeError::kNotRunning);

    for (;;) {
      if (stop_.load()) {
        state_.store(AgentState::kStopped);
        return R::success();
      }
      std::shared_ptr<FramedConnection> conn = Connection();
      if (!conn) {
        auto rc = Reconnect();
        if (!rc.has_value()) return R::error(rc.get_error());
        if (stop_.load()) continue;
        conn = Connection();
      }

      state_.store(AgentState::kServing);
      const SessionEnd end = RunSession(conn);
      // Waits out a response the worker may still be writing on this link.
      conn->Close();
      {
        std::lock_guard<std::mutex> lock(id_mtx_);
        if (conn_ == conn) conn_.reset();
      }
      switch (end) {
        case SessionEnd::kStopped:
          state_.store(AgentState::kStopped);
          return R::success();
        case SessionEnd::kGatewayClosed:
          state_.store(AgentState::kIdle);
          return R::success();
        case SessionEnd::kLost:
          NGW_LOG_WARN("Agent", "connection to gateway lost, reconnecting");
          break;
      }
    }
  }

  /** @brief Ask Pair()/Serve() to finish. Safe from any thread. */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(stop_mtx_);
      stop_.store(true);
    }
    stop_cv_.notify_all();
    wake_.Notify();
  }

  AgentState State() const noexcept { return state_.load(); }
  NodeError LastRejectReason() const noexcept { return last_reject_.load(); }

  bool IsPaired() const {
    std::lock_guard<std::mutex> lock(id_mtx_);
    return !token_.empty();
  }

  std::string NodeId() const {
    std::lock_guard<std::mutex> lock(id_mtx_);
    return node_id_;
  }

  std::string SessionToken() const {
    std::lock_guard<std::mutex> lock(id_mtx_);
    return token_;
  }

  /** @brief Reconnect attempts made since the last successful session. */
  uint32_t ReconnectAttempts() const noexcept { return reconnect_attempts_.load(); }

 private:
  enum class SessionEnd : uint8_t { kStopped = 0, kGatewayClosed, kLost };

  struct Job {
    std::shared_ptr<FramedConnection> conn;
    uint64_t command_id = 0;
    std::string payload;
  };

  std::shared_ptr<FramedConnection> Connection() const {
    std::lock_guard<std::mutex> lock(id_mtx_);
    return conn_;
  }

  // --------------------------------------------------------------------------
  // Connection setup
  // --------------------------------------------------------------------------

  expected<PairingResponse, NodeError> Handshake(PairMode mode,
                                                 const std::string& credential,
                                                 std::shared_ptr<FramedConnection>& out) {
    using R = expected<PairingResponse, NodeError>;
    auto addr = SocketAddress::Resolve(cfg_.gateway_host.c_str(), cfg_.gateway_port);
    if (!addr.has_value()) {
      NGW_LOG_ERROR("Agent", "cannot resolve %s", cfg_.gateway_host.c_str());
      return R::error(NodeError::kConnectFailed);
    }
    auto sock = TcpSocket::Create();
    if (!sock.has_value()) return R::error(NodeError::kConnectFailed);
    auto connected = sock.value().Connect(addr.value(),
                                          static_cast<int32_t>(cfg_.connect_timeout_ms));
    if (!connected.has_value()) {
      NGW_LOG_WARN("Agent", "connect to %s:%u failed", cfg_.gateway_host.c_str(),
                   cfg_.gateway_port);
      return R::error(NodeError::kConnectFailed);
    }
    static_cast<void>(sock.value().SetNoDelay(true));
    auto conn = std::make_shared<FramedConnection>(std::move(sock.value()));
    conn->SetSendTimeout(static_cast<int32_t>(cfg_.heartbeat_interval_ms * kAgentMissLimit));

    PairFrame pair;
    pair.mode = mode;
    pair.credential = credential;
    pair.hello = cfg_.hello;
    auto sent = conn->Send(Message{std::move(pair)});
    if (!sent.has_value()) return R::error(NodeError::kConnectionLost);

    auto reply = conn->Receive(static_cast<int32_t>(cfg_.connect_timeout_ms));
    if (!reply.has_value()) return R::error(reply.get_error());
    const auto* pr = std::get_if<PairingResponse>(&reply.value());
    if (pr == nullptr) {
      NGW_LOG_ERROR("Agent", "expected PairingResponse, got frame type %u",
                    static_cast<uint32_t>(TypeOf(reply.value())));
      return R::error(NodeError::kProtocolViolation);
    }
    if (pr->accepted) out = std::move(conn);
    return R::success(*pr);
  }

  /** @brief Token-based reconnect loop with backoff. */
  expected<void, NodeError> Reconnect() {
    using R = expected<void, NodeError>;
    state_.store(AgentState::kReconnecting);
    Backoff backoff(cfg_.backoff);
    reconnect_attempts_.store(0);

    for (;;) {
      if (cfg_.reconnect_max_attempts != 0U &&
          reconnect_attempts_.load() >= cfg_.reconnect_max_attempts) {
        NGW_LOG_ERROR("Agent", "giving up after %u reconnect attempts",
                      reconnect_attempts_.load());
        state_.store(AgentState::kIdle);
        return R::error(NodeError::kConnectionLost);
      }
      const uint32_t delay = backoff.Next();
      {
        std::unique_lock<std::mutex> lock(stop_mtx_);
        stop_cv_.wait_for(lock, std::chrono::milliseconds(delay),
                          [this] { return stop_.load(); });
      }
      if (stop_.load()) return R::success();
      reconnect_attempts_.fetch_add(1);

      std::shared_ptr<FramedConnection> conn;
      auto resp = Handshake(PairMode::kToken, SessionToken(), conn);
      if (!resp.has_value()) {
        NGW_LOG_DEBUG("Agent", "reconnect attempt %u failed: %s",
                      reconnect_attempts_.load(), ToString(resp.get_error()));
        continue;
      }
      const PairingResponse& pr = resp.value();
      if (!pr.accepted) {
        last_reject_.store(pr.reason);
        if (pr.reason == NodeError::kTokenRejected) {
          NGW_LOG_WARN("Agent", "session token rejected, a new pairing code is required");
          std::lock_guard<std::mutex> lock(id_mtx_);
          token_.clear();
          state_.store(AgentState::kNeedsPairing);
          return R::error(NodeError::kTokenRejected);
        }
        NGW_LOG_WARN("Agent", "reconnect rejected: %s", pr.reason_text.c_str());
        continue;
      }
      {
        std::lock_guard<std::mutex> lock(id_mtx_);
        conn_ = std::move(conn);
        token_ = pr.session_token;
      }
      NGW_LOG_INFO("Agent", "reconnected as node %s after %u attempts", pr.node_id.c_str(),
                   reconnect_attempts_.load());
      return R::success();
    }
  }

  // --------------------------------------------------------------------------
  // Serving
  // --------------------------------------------------------------------------

  SessionEnd RunSession(const std::shared_ptr<FramedConnection>& conn) {
    const uint64_t interval = cfg_.heartbeat_interval_ms;
    uint64_t next_heartbeat = SteadyNowMs() + interval;
    uint64_t last_traffic = SteadyNowMs();

    for (;;) {
      if (stop_.load()) {
        CloseFrame close;
        close.reason = NodeError::kNotRunning;
        close.reason_text = "agent stopping";
        static_cast<void>(conn->Send(Message{close}));
        return SessionEnd::kStopped;
      }

      const uint64_t now = SteadyNowMs();
      if (now - last_traffic >= interval * kAgentMissLimit) {
        NGW_LOG_WARN("Agent", "gateway silent for %u heartbeat intervals", kAgentMissLimit);
        return SessionEnd::kLost;
      }
      if (now >= next_heartbeat) {
        HeartbeatFrame hb;
        hb.timestamp_us = SteadyNowUs();
        if (!conn->Send(Message{hb}).has_value()) return SessionEnd::kLost;
        next_heartbeat = now + interval;
      }

      pollfd pfds[2];
      pfds[0] = pollfd{conn->Fd(), POLLIN, 0};
      pfds[1] = pollfd{wake_.ReadFd(), POLLIN, 0};
      const uint64_t wait = next_heartbeat > now ? next_heartbeat - now : 0;
      int32_t pr = ::poll(pfds, 2, static_cast<int32_t>(wait));
      if (pr < 0 && errno != EINTR) return SessionEnd::kLost;
      if (pr <= 0) continue;

      if ((pfds[1].revents & POLLIN) != 0) wake_.Drain();
      if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

      auto pumped = conn->Pump();
      Message msg;
      while (conn->PopQueued(msg)) {
        last_traffic = SteadyNowMs();
        if (const auto* cmd = std::get_if<CommandFrame>(&msg)) {
          Enqueue(Job{conn, cmd->command_id, cmd->payload});
        } else if (const auto* close = std::get_if<CloseFrame>(&msg)) {
          NGW_LOG_INFO("Agent", "gateway closed the session: %s",
                       close->reason_text.c_str());
          return SessionEnd::kGatewayClosed;
        } else if (std::get_if<HeartbeatAckFrame>(&msg) == nullptr &&
                   std::get_if<HeartbeatFrame>(&msg) == nullptr) {
          NGW_LOG_ERROR("Agent", "unexpected frame type %u from gateway",
                        static_cast<uint32_t>(TypeOf(msg)));
          return SessionEnd::kLost;
        }
      }
      if (!pumped.has_value()) return SessionEnd::kLost;
    }
  }

  void Enqueue(Job job) {
    {
      std::lock_guard<std::mutex> lock(job_mtx_);
      jobs_.push_back(std::move(job));
    }
    job_cv_.notify_one();
  }

  void WorkerLoop() {
    for (;;) {
      Job job;
      {
        std::unique_lock<std::mutex> lock(job_mtx_);
        job_cv_.wait(lock, [this] { return worker_exit_ || !jobs_.empty(); });
        if (jobs_.empty()) return;
        job = std::move(jobs_.front());
        jobs_.pop_front();
      }
      Execute(job);
    }
  }

  void Execute(const Job& job) {
    CommandResult result = handler_ ? handler_(job.payload) : CommandResult::Unhandled();
    if (result.outcome == CommandResult::Outcome::kUnhandled && job.payload == kPingPayload) {
      result = CommandResult::Ok(kPongResult);
    }

    ResponseFrame resp;
    resp.command_id = job.command_id;
    switch (result.outcome) {
      case CommandResult::Outcome::kOk:
        resp.ok = true;
        resp.result = std::move(result.text);
        break;
      case CommandResult::Outcome::kFailed:
        resp.error = NodeError::kCommandFailed;
        resp.message = std::move(result.text);
        break;
      case CommandResult::Outcome::kUnhandled:
        resp.error = NodeError::kCommandFailed;
        resp.message = "unsupported command";
        break;
    }
    if (!job.conn->Send(Message{std::move(resp)}).has_value()) {
      NGW_LOG_WARN("Agent", "response for command %llu lost",
                   static_cast<unsigned long long>(job.command_id));  // NOLINT
    }
  }

  const AgentConfig cfg_;
  CommandHandler handler_;

  std::atomic<AgentState> state_{AgentState::kIdle};
  std::atomic<NodeError> last_reject_{NodeError::kCodeNotFound};
  std::atomic<uint32_t> reconnect_attempts_{0};

  mutable std::mutex id_mtx_;
  std::string node_id_;
  std::string token_;
  std::shared_ptr<FramedConnection> conn_;

  std::mutex stop_mtx_;
  std::condition_variable stop_cv_;
  std::atomic<bool> stop_{false};
  WakePipe wake_;

  std::mutex job_mtx_;
  std::condition_variable job_cv_;
  std::deque<Job> jobs_;
  bool worker_exit_ = false;
  std::thread worker_;
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_AGENT_HPP_
