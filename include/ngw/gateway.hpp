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
 * @file gateway.hpp
 * @brief Gateway composition root: listener, handshakes, housekeeping and
 *        the operator-facing API over the pairing/registry/dispatch core.
 *
 * Usage:
 * @code
 *   ngw::Gateway gw(cfg);
 *   if (!gw.Start()) { ... }
 *   auto code = gw.IssueCode("build-box-3");
 *   ...
 *   auto r = gw.Send(node_id, "uptime", 5000);
 *   gw.Stop();
 * @endcode
 */

#ifndef NGW_GATEWAY_HPP_
#define NGW_GATEWAY_HPP_

#include "ngw/audit.hpp"
#include "ngw/backoff.hpp"
#include "ngw/config.hpp"
#include "ngw/dispatcher.hpp"
#include "ngw/log.hpp"
#include "ngw/pairing.hpp"
#include "ngw/registry.hpp"
#include "ngw/session.hpp"
#include "ngw/timer.hpp"
#include "ngw/transport.hpp"

#if NGW_HAS_NETWORK

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ngw {

/// Accept/handshake loops re-check the running flag at this granularity.
constexpr int32_t kGatewayPollSliceMs = 100;

class Gateway {
 public:
  /**
   * @param audit External audit collaborator; nullptr selects the built-in
   *              LogAuditSink. Must outlive the gateway.
   */
  explicit Gateway(const GatewayConfig& cfg, AuditSink* audit = nullptr)
      : cfg_(cfg),
        audit_(audit != nullptr ? audit : &log_audit_),
        registry_(cfg.session, cfg.max_nodes, audit_),
        issuer_(registry_, cfg.pairing, cfg.session, audit_),
        dispatcher_(registry_, cfg.default_timeout_ms, audit_),
        timer_(4) {}

  ~Gateway() { Stop(); }

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;

  /**
   * @brief Bind, listen and start the accept thread and sweeps.
   * @return kBindFailed if the listen address is unusable.
   */
  expected<void, NodeError> Start() {
    using R = expected<void, NodeError>;
    if (running_.load(std::memory_order_acquire)) return R::success();

    auto addr = SocketAddress::FromIpv4(cfg_.listen_host.c_str(), cfg_.listen_port);
    if (!addr.has_value()) {
      NGW_LOG_ERROR("Gateway", "bad listen address %s", cfg_.listen_host.c_str());
      return R::error(NodeError::kBindFailed);
    }
    auto listener = TcpListener::Create();
    if (!listener.has_value()) return R::error(NodeError::kBindFailed);
    static_cast<void>(listener.value().SetReuseAddr(true));
    if (!listener.value().Bind(addr.value()).has_value() ||
        !listener.value().Listen().has_value()) {
      NGW_LOG_ERROR("Gateway", "cannot listen on %s:%u", cfg_.listen_host.c_str(),
                    cfg_.listen_port);
      return R::error(NodeError::kBindFailed);
    }
    listener_ = std::move(listener.value());
    port_ = listener_.LocalPort();

    static_cast<void>(timer_.Add(cfg_.pairing.sweep_interval_ms, &Gateway::SweepCodesTick,
                                 this));
    const uint32_t purge_base =
        std::min(cfg_.session.grace_period_ms, cfg_.session.pending_timeout_ms) / 4U;
    const uint32_t purge_period = std::min<uint32_t>(std::max<uint32_t>(purge_base, 10U), 1000U);
    static_cast<void>(timer_.Add(purge_period, &Gateway::PurgeTick, this));
    static_cast<void>(timer_.Start());

    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });
    NGW_LOG_INFO("Gateway", "listening on %s:%u (max %u nodes)", cfg_.listen_host.c_str(),
                 port_, cfg_.max_nodes);
    return R::success();
  }

  /**
   * @brief Graceful shutdown: stop accepting, drain sessions for up to
   *        shutdown_grace_ms, then force-close what is left.
   */
  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    NGW_LOG_INFO("Gateway", "stopping");
    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.Close();
    JoinHandshakes(true);
    timer_.Stop();

    registry_.DrainAll();
    const uint64_t deadline = SteadyNowMs() + cfg_.shutdown_grace_ms;
    while (registry_.PendingCommands() > 0 && SteadyNowMs() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    const uint32_t stragglers = registry_.PendingCommands();
    if (stragglers > 0) {
      NGW_LOG_WARN("Gateway", "force-closing sessions with %u commands in flight",
                   stragglers);
    }
    registry_.Clear();
    NGW_LOG_INFO("Gateway", "stopped");
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  /** @brief Bound port (useful with listen_port = 0). */
  uint16_t Port() const noexcept { return port_; }

  // --------------------------------------------------------------------------
  // Operator API
  // --------------------------------------------------------------------------

  expected<PairingRequest, NodeError> IssueCode(const std::string& hint = std::string()) {
    return issuer_.Issue(hint);
  }

  std::vector<NodeInfo> ListNodes() const { return registry_.List(); }

  optional<NodeInfo> NodeStatus(const std::string& node_id) const {
    return registry_.Get(node_id);
  }

  /** @brief Readiness query for external health pollers. */
  bool IsConnected(const std::string& node_id) const {
    return registry_.IsConnected(node_id);
  }

  /** @brief Poll IsConnected() with the standard backoff until @p deadline_ms. */
  bool WaitUntilConnected(const std::string& node_id, uint32_t deadline_ms) const {
    return RetryUntil([this, &node_id]() { return IsConnected(node_id); },
                      cfg_.readiness_backoff, deadline_ms);
  }

  expected<NodeResponse, NodeError> Send(const std::string& node_id,
                                         const std::string& payload,
                                         uint32_t timeout_ms = 0) {
    return dispatcher_.Send(node_id, payload, timeout_ms);
  }

  std::map<std::string, NodeResponse> Broadcast(const std::string& payload,
                                                uint32_t timeout_ms = 0) {
    return dispatcher_.Broadcast(payload, timeout_ms);
  }

  bool Cancel(uint64_t command_id) { return dispatcher_.Cancel(command_id); }

  ConnectionRegistry& Registry() noexcept { return registry_; }
  PairingCodeIssuer& Issuer() noexcept { return issuer_; }
  CommandDispatcher& Dispatcher() noexcept { return dispatcher_; }
  const GatewayConfig& Settings() const noexcept { return cfg_; }

 private:
  struct HandshakeEntry {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  static void SweepCodesTick(void* ctx) {
    static_cast<void>(static_cast<Gateway*>(ctx)->issuer_.ExpireSweep());
  }

  static void PurgeTick(void* ctx) {
    static_cast<void>(static_cast<Gateway*>(ctx)->registry_.PurgeExpired());
  }

  void AcceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
      JoinHandshakes(false);

      SocketAddress peer;
      auto accepted = listener_.Accept(peer, kGatewayPollSliceMs);
      if (!accepted.has_value()) {
        if (accepted.get_error() != SocketError::kTimeout) {
          NGW_LOG_WARN("Gateway", "accept failed");
          std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        continue;
      }
      char ip[32];
      peer.FormatIp(ip, sizeof(ip));
      NGW_LOG_DEBUG("Gateway", "connection from %s:%u", ip, peer.Port());

      TcpSocket sock = std::move(accepted.value());
      static_cast<void>(sock.SetNoDelay(true));
      auto conn = std::make_shared<std::unique_ptr<FramedConnection>>(
          std::make_unique<FramedConnection>(std::move(sock)));
      auto finished = std::make_shared<std::atomic<bool>>(false);

      std::lock_guard<std::mutex> lock(handshakes_mtx_);
      handshakes_.push_back(HandshakeEntry{std::thread([this, conn, finished]() {
                                             Handshake(*conn);
                                             finished->store(true,
                                                             std::memory_order_release);
                                           }),
                                           finished});
    }
  }

  void JoinHandshakes(bool all) {
    std::vector<HandshakeEntry> done;
    {
      std::lock_guard<std::mutex> lock(handshakes_mtx_);
      for (size_t i = 0; i < handshakes_.size();) {
        if (all || handshakes_[i].finished->load(std::memory_order_acquire)) {
          done.push_back(std::move(handshakes_[i]));
          handshakes_[i] = std::move(handshakes_.back());
          handshakes_.pop_back();
        } else {
          ++i;
        }
      }
    }
    for (auto& e : done) {
      if (e.thread.joinable()) e.thread.join();
    }
  }

  /** @brief First frame must be Pair; answer it and hand the link to a session. */
  void Handshake(std::unique_ptr<FramedConnection>& conn) {
    const uint64_t deadline = SteadyNowMs() + cfg_.handshake_timeout_ms;
    expected<Message, NodeError> first = expected<Message, NodeError>::error(NodeError::kTimeout);
    while (running_.load(std::memory_order_acquire)) {
      const uint64_t now = SteadyNowMs();
      if (now >= deadline) break;
      const uint64_t slice = std::min<uint64_t>(deadline - now, kGatewayPollSliceMs);
      first = conn->Receive(static_cast<int32_t>(slice));
      if (first.has_value() || first.get_error() != NodeError::kTimeout) break;
    }
    if (!first.has_value()) {
      if (first.get_error() == NodeError::kTimeout && running_.load()) {
        NGW_LOG_WARN("Gateway", "handshake timed out after %u ms", cfg_.handshake_timeout_ms);
      } else if (first.get_error() == NodeError::kProtocolViolation) {
        Reject(*conn, NodeError::kProtocolViolation);
      }
      return;
    }

    const auto* pair = std::get_if<PairFrame>(&first.value());
    if (pair == nullptr) {
      NGW_LOG_WARN("Gateway", "first frame was type %u, expected Pair",
                   static_cast<uint32_t>(TypeOf(first.value())));
      Reject(*conn, NodeError::kProtocolViolation);
      return;
    }

    if (pair->mode == PairMode::kCode) {
      PairByCode(*pair, conn);
    } else {
      ResumeByToken(*pair, conn);
    }
  }

  void PairByCode(const PairFrame& pair, std::unique_ptr<FramedConnection>& conn) {
    if (registry_.Size() >= registry_.MaxNodes()) {
      NGW_LOG_WARN("Gateway", "pairing refused: %u nodes registered", registry_.Size());
      Reject(*conn, NodeError::kCapacityReached);
      return;
    }
    auto info = issuer_.Consume(pair.credential, conn, pair.hello);
    if (!info.has_value() && conn) {
      // Rejected before the connection was handed to a session.
      Reject(*conn, info.get_error());
    }
  }

  void ResumeByToken(const PairFrame& pair, std::unique_ptr<FramedConnection>& conn) {
    auto node_id = registry_.FindByToken(pair.credential);
    if (!node_id.has_value()) {
      NGW_LOG_WARN("Gateway", "reconnect with unknown token refused");
      Reject(*conn, NodeError::kTokenRejected);
      return;
    }
    auto session = std::make_shared<NodeSession>(node_id.value(), std::move(conn),
                                                 cfg_.session, registry_.ClosedHook());
    auto resumed = registry_.Resume(pair.credential, pair.hello, session);
    if (!resumed.has_value()) {
      session->Reject(PairingResponse::Rejected(resumed.get_error()));
      return;
    }
    auto started = session->Start(PairingResponse::Accepted(node_id.value(), pair.credential));
    if (!started.has_value() || !registry_.Activate(node_id.value()).has_value()) {
      static_cast<void>(registry_.RemovePending(node_id.value()));
      return;
    }
    NGW_LOG_INFO("Gateway", "node %s reconnected", node_id.value().c_str());
    detail::Audit(audit_, AuditKind::kPaired, node_id.value(), "resumed");
  }

  static void Reject(FramedConnection& conn, NodeError reason) {
    static_cast<void>(conn.Send(Message{PairingResponse::Rejected(reason)}));
    conn.Close();
  }

  const GatewayConfig cfg_;
  LogAuditSink log_audit_;
  AuditSink* audit_;
  ConnectionRegistry registry_;
  PairingCodeIssuer issuer_;
  CommandDispatcher dispatcher_;
  TimerScheduler timer_;

  TcpListener listener_;
  uint16_t port_ = 0;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;
  std::mutex handshakes_mtx_;
  std::vector<HandshakeEntry> handshakes_;
};

// ============================================================================
// SharedGateway
// ============================================================================

/**
 * @brief Process-wide, once-initialised, reference-counted gateway handle.
 *
 * Acquire() constructs and starts the gateway on first use; later callers
 * get the same instance and their config is ignored. Teardown() stops it
 * and drops the shared reference; holders keep a stopped object alive
 * until they release it.
 */
class SharedGateway {
 public:
  static expected<std::shared_ptr<Gateway>, NodeError> Acquire(const GatewayConfig& cfg) {
    using R = expected<std::shared_ptr<Gateway>, NodeError>;
    Slot& slot = GetSlot();
    std::lock_guard<std::mutex> lock(slot.mtx);
    if (slot.instance) return R::success(slot.instance);

    auto gw = std::make_shared<Gateway>(cfg);
    auto started = gw->Start();
    if (!started.has_value()) return R::error(started.get_error());
    slot.instance = gw;
    return R::success(std::move(gw));
  }

  /** @brief Running instance, or nullptr before Acquire()/after Teardown(). */
  static std::shared_ptr<Gateway> Current() {
    Slot& slot = GetSlot();
    std::lock_guard<std::mutex> lock(slot.mtx);
    return slot.instance;
  }

  static void Teardown() {
    std::shared_ptr<Gateway> gw;
    {
      Slot& slot = GetSlot();
      std::lock_guard<std::mutex> lock(slot.mtx);
      gw = std::move(slot.instance);
    }
    if (gw) gw->Stop();
  }

 private:
  struct Slot {
    std::mutex mtx;
    std::shared_ptr<Gateway> instance;
  };

  static Slot& GetSlot() {
    static Slot slot;
    return slot;
  }
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_GATEWAY_HPP_
