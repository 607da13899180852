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
 * @file session.hpp
 * @brief Gateway-side per-node session actor.
 *
 * Each NodeSession owns one node's framed connection, its pending command
 * table and its heartbeat bookkeeping. All of that state is touched only by
 * the session's own thread; other threads talk to it through a mailbox and
 * read a few atomics (state, last seen, pending count).
 *
 * Command completion goes through CommandSlot, a single-resolution handle:
 * the first of {response, timeout, cancel, connection loss} to claim the
 * slot wins and every later attempt is a no-op.
 */

#ifndef NGW_SESSION_HPP_
#define NGW_SESSION_HPP_

#include "ngw/config.hpp"
#include "ngw/log.hpp"
#include "ngw/transport.hpp"
#include "ngw/types.hpp"

#if NGW_HAS_NETWORK

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace ngw {

// ============================================================================
// CommandSlot
// ============================================================================

/// Extra wait beyond a command's deadline before the caller resolves the
/// slot itself. Covers a session thread that is slow to expire it.
constexpr uint32_t kCommandWaitSlackMs = 250;

class CommandSlot {
 public:
  CommandSlot(uint64_t command_id, uint64_t deadline_ms) noexcept
      : command_id_(command_id), deadline_ms_(deadline_ms) {}

  CommandSlot(const CommandSlot&) = delete;
  CommandSlot& operator=(const CommandSlot&) = delete;

  /**
   * @brief Resolve the slot if nobody has yet.
   * @return true if this call won the resolution.
   */
  bool TryResolve(NodeResponse response) {
    bool expected_claimed = false;
    if (!claimed_.compare_exchange_strong(expected_claimed, true,
                                          std::memory_order_acq_rel)) {
      return false;
    }
    response.command_id = command_id_;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      result_ = std::move(response);
      ready_ = true;
    }
    cv_.notify_all();
    return true;
  }

  /**
   * @brief Block until resolved. Never waits past deadline + slack: after
   *        that the caller claims the slot as Timeout itself.
   */
  NodeResponse Wait() {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      const uint64_t limit = deadline_ms_ + kCommandWaitSlackMs;
      while (!ready_) {
        const uint64_t now = SteadyNowMs();
        if (now >= limit) break;
        cv_.wait_for(lock, std::chrono::milliseconds(limit - now));
      }
      if (ready_) return result_;
    }
    static_cast<void>(TryResolve(NodeResponse::TimedOut(command_id_, SteadyNowMs())));
    std::lock_guard<std::mutex> lock(mtx_);
    return result_;
  }

  bool IsResolved() const noexcept { return claimed_.load(std::memory_order_acquire); }
  uint64_t CommandId() const noexcept { return command_id_; }
  uint64_t DeadlineMs() const noexcept { return deadline_ms_; }

 private:
  const uint64_t command_id_;
  const uint64_t deadline_ms_;  ///< Steady clock.
  std::atomic<bool> claimed_{false};
  std::mutex mtx_;
  std::condition_variable cv_;
  bool ready_ = false;
  NodeResponse result_;
};

using CommandHandle = std::shared_ptr<CommandSlot>;

// ============================================================================
// NodeSession
// ============================================================================

class NodeSession;

/// Invoked once on the session thread after the session reaches kClosed.
using SessionClosedFn =
    std::function<void(const std::string& node_id, NodeSession* session, NodeError reason)>;

class NodeSession {
 public:
  /// Late responses for this many retired command ids are dropped quietly.
  static constexpr size_t kRetiredHistory = 1024;
  /// How long the destructor lets an orderly stop run before cutting the link.
  static constexpr uint32_t kStopWaitMs = 500;

  NodeSession(std::string node_id, std::unique_ptr<FramedConnection> conn,
              const SessionSettings& settings, SessionClosedFn on_closed)
      : node_id_(std::move(node_id)),
        conn_(std::move(conn)),
        settings_(settings),
        on_closed_(std::move(on_closed)) {
    // A node that stops reading is as dead as one that stops talking.
    conn_->SetSendTimeout(static_cast<int32_t>(SilenceLimitMs()));
  }

  ~NodeSession() {
    RequestStop(NodeError::kNotRunning);
    if (thread_.joinable()) {
      if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
      } else {
        if (!WaitClosed(kStopWaitMs)) ForceClose();
        thread_.join();
      }
    }
  }

  NodeSession(const NodeSession&) = delete;
  NodeSession& operator=(const NodeSession&) = delete;

  /**
   * @brief Complete the handshake: send Accepted and start the session thread.
   * @return kConnectionLost if the response could not be written.
   */
  expected<void, NodeError> Start(const PairingResponse& accepted) {
    NGW_ASSERT(accepted.accepted);
    if (state_.load() != SessionState::kHandshaking) {
      return expected<void, NodeError>::error(NodeError::kNotRunning);
    }
    auto r = conn_->Send(Message{accepted});
    if (!r.has_value()) {
      NGW_LOG_WARN("Session", "node %s: handshake reply failed", node_id_.c_str());
      state_.store(SessionState::kClosed);
      {
        std::lock_guard<std::mutex> lock(mbox_mtx_);
        accepting_ = false;
      }
      conn_->Close();
      return expected<void, NodeError>::error(NodeError::kConnectionLost);
    }
    const uint64_t now = SteadyNowMs();
    last_traffic_ms_ = now;
    last_seen_wall_ms_.store(WallNowMs());
    state_.store(SessionState::kActive);
    thread_ = std::thread(&NodeSession::Run, this);
    NGW_LOG_INFO("Session", "node %s: session active (fd %d)", node_id_.c_str(),
                 conn_->Fd());
    return expected<void, NodeError>::success();
  }

  /** @brief Answer a failed handshake and close without starting. */
  void Reject(const PairingResponse& rejected) {
    if (state_.load() != SessionState::kHandshaking) return;
    static_cast<void>(conn_->Send(Message{rejected}));
    state_.store(SessionState::kClosed);
    {
      std::lock_guard<std::mutex> lock(mbox_mtx_);
      accepting_ = false;
    }
    conn_->Close();
  }

  /**
   * @brief Queue a command for this node.
   *
   * The returned slot is already resolved as Failure{NodeNotConnected}
   * when the session no longer accepts work.
   */
  CommandHandle SendCommand(const NodeCommand& cmd) {
    const uint64_t deadline = cmd.issued_at_ms + cmd.timeout_ms;
    auto slot = std::make_shared<CommandSlot>(cmd.command_id, deadline);
    {
      std::lock_guard<std::mutex> lock(mbox_mtx_);
      if (accepting_ && state_.load() == SessionState::kActive) {
        Mail mail;
        mail.kind = MailKind::kSend;
        mail.slot = slot;
        mail.command = cmd;
        mailbox_.push_back(std::move(mail));
        pending_count_.fetch_add(1);
        wake_.Notify();
        return slot;
      }
    }
    static_cast<void>(slot->TryResolve(NodeResponse::Failure(
        cmd.command_id, NodeError::kNodeNotConnected, "session not active", SteadyNowMs())));
    return slot;
  }

  /** @brief Forget @p command_id; a later response for it is dropped silently. */
  void Cancel(uint64_t command_id) {
    Mail mail;
    mail.kind = MailKind::kCancel;
    mail.command.command_id = command_id;
    Post(std::move(mail));
  }

  /** @brief Stop accepting commands; close once in-flight commands settle. */
  void Drain() {
    {
      std::lock_guard<std::mutex> lock(mbox_mtx_);
      accepting_ = false;
    }
    Mail mail;
    mail.kind = MailKind::kDrain;
    Post(std::move(mail));
  }

  /**
   * @brief Close now; pending commands resolve as ConnectionLost.
   *
   * The node is sent a Close frame carrying @p reason unless the reason is
   * kConnectionLost.
   */
  void RequestStop(NodeError reason) {
    Mail mail;
    mail.kind = MailKind::kStop;
    mail.reason = reason;
    Post(std::move(mail));
  }

  /**
   * @brief Cut the link from the calling thread.
   *
   * Unblocks a session thread stuck writing to a node that stopped
   * reading; the session then closes as ConnectionLost.
   */
  void ForceClose() {
    conn_->Shutdown();
    RequestStop(NodeError::kConnectionLost);
  }

  /** @return true once the session is kClosed, false after @p timeout_ms. */
  bool WaitClosed(uint32_t timeout_ms) const {
    const uint64_t deadline = SteadyNowMs() + timeout_ms;
    while (state_.load() != SessionState::kClosed) {
      if (SteadyNowMs() >= deadline) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
  }

  /** @brief Wait for the session thread to finish (not from the session thread). */
  void Join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    }
  }

  const std::string& NodeId() const noexcept { return node_id_; }
  SessionState State() const noexcept { return state_.load(); }
  bool IsActive() const noexcept { return state_.load() == SessionState::kActive; }
  uint32_t PendingCount() const noexcept { return pending_count_.load(); }
  uint64_t LastSeenMs() const noexcept { return last_seen_wall_ms_.load(); }

 private:
  enum class MailKind : uint8_t { kSend = 0, kCancel, kDrain, kStop };

  struct Mail {
    MailKind kind = MailKind::kStop;
    CommandHandle slot;
    NodeCommand command;
    NodeError reason = NodeError::kNotRunning;
  };

  void Post(Mail mail) {
    std::lock_guard<std::mutex> lock(mbox_mtx_);
    mailbox_.push_back(std::move(mail));
    wake_.Notify();
  }

  // --------------------------------------------------------------------------
  // Session thread
  // --------------------------------------------------------------------------

  uint64_t SilenceLimitMs() const noexcept {
    return static_cast<uint64_t>(settings_.heartbeat_interval_ms) *
           settings_.heartbeat_miss_limit;
  }

  void Run() {
    const uint64_t silence_limit_ms = SilenceLimitMs();
    bool done = false;
    while (!done) {
      const uint64_t now = SteadyNowMs();
      uint64_t next_event = last_traffic_ms_ + silence_limit_ms;
      for (const auto& kv : pending_) {
        if (kv.second->DeadlineMs() < next_event) next_event = kv.second->DeadlineMs();
      }
      const uint64_t wait = (next_event > now) ? (next_event - now) : 0;

      pollfd pfds[2];
      pfds[0] = pollfd{conn_->Fd(), POLLIN, 0};
      pfds[1] = pollfd{wake_.ReadFd(), POLLIN, 0};
      int32_t pr = ::poll(pfds, 2, static_cast<int32_t>(wait > 1000 ? 1000 : wait));
      if (pr < 0 && errno != EINTR) {
        Finish(NodeError::kConnectionLost, false);
        return;
      }

      if (pr > 0 && (pfds[1].revents & POLLIN) != 0) {
        wake_.Drain();
        done = ProcessMailbox();
        if (done) return;
      }

      if (pr > 0 && (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
        auto pumped = conn_->Pump();
        // Deliver whatever decoded before the failure.
        Message msg;
        while (!done && conn_->PopQueued(msg)) done = HandleMessage(msg);
        if (done) return;
        if (!pumped.has_value()) {
          if (pumped.get_error() == NodeError::kProtocolViolation) {
            NGW_LOG_ERROR("Session", "node %s: protocol violation, closing",
                          node_id_.c_str());
            Finish(NodeError::kProtocolViolation, true);
          } else {
            NGW_LOG_WARN("Session", "node %s: connection lost", node_id_.c_str());
            Finish(NodeError::kConnectionLost, false);
          }
          return;
        }
      }

      ExpireOverdue(SteadyNowMs());

      if (SteadyNowMs() - last_traffic_ms_ >= silence_limit_ms) {
        NGW_LOG_WARN("Session", "node %s: no traffic for %u heartbeat intervals",
                     node_id_.c_str(), settings_.heartbeat_miss_limit);
        state_.store(SessionState::kDraining);
        Finish(NodeError::kTimeout, false);
        return;
      }

      if (state_.load() == SessionState::kDraining && pending_.empty()) {
        Finish(NodeError::kNotRunning, true);
        return;
      }
    }
  }

  /** @return true when the session has finished. */
  bool ProcessMailbox() {
    std::deque<Mail> batch;
    {
      std::lock_guard<std::mutex> lock(mbox_mtx_);
      batch.swap(mailbox_);
    }
    for (size_t i = 0; i < batch.size(); ++i) {
      Mail& mail = batch[i];
      switch (mail.kind) {
        case MailKind::kSend:
          if (!WriteCommand(mail)) {
            // The failed command is already in pending_; hand the rest back
            // so Finish() resolves them too.
            Requeue(batch, i + 1);
            Finish(NodeError::kConnectionLost, false);
            return true;
          }
          break;
        case MailKind::kCancel: {
          auto it = pending_.find(mail.command.command_id);
          if (it != pending_.end()) {
            pending_.erase(it);
            pending_count_.fetch_sub(1);
            Retire(mail.command.command_id);
            NGW_LOG_DEBUG("Session", "node %s: command %llu cancelled", node_id_.c_str(),
                          static_cast<unsigned long long>(mail.command.command_id));  // NOLINT
          }
          break;
        }
        case MailKind::kDrain:
          if (state_.load() == SessionState::kActive) {
            state_.store(SessionState::kDraining);
            NGW_LOG_INFO("Session", "node %s: draining (%zu in flight)", node_id_.c_str(),
                         pending_.size());
          }
          break;
        case MailKind::kStop:
          Requeue(batch, i + 1);
          // kConnectionLost drops the link without a goodbye, so the node
          // treats it as an outage and reconnects.
          Finish(mail.reason, mail.reason != NodeError::kConnectionLost);
          return true;
      }
    }
    return false;
  }

  /** @brief Put batch[from..] back at the head of the mailbox, in order. */
  void Requeue(std::deque<Mail>& batch, size_t from) {
    std::lock_guard<std::mutex> lock(mbox_mtx_);
    for (size_t i = batch.size(); i > from; --i) {
      mailbox_.push_front(std::move(batch[i - 1]));
    }
  }

  /** @return false on transport failure. */
  bool WriteCommand(Mail& mail) {
    const uint64_t id = mail.command.command_id;
    if (mail.slot->IsResolved()) {
      // Cancelled or timed out before it reached the wire.
      pending_count_.fetch_sub(1);
      Retire(id);
      return true;
    }
    if (state_.load() != SessionState::kActive) {
      pending_count_.fetch_sub(1);
      static_cast<void>(mail.slot->TryResolve(NodeResponse::Failure(
          id, NodeError::kNodeNotConnected, "session draining", SteadyNowMs())));
      return true;
    }
    pending_.emplace(id, mail.slot);

    CommandFrame frame;
    frame.command_id = id;
    frame.timeout_ms = mail.command.timeout_ms;
    frame.payload = mail.command.payload;
    auto r = conn_->Send(Message{std::move(frame)});
    if (!r.has_value()) {
      NGW_LOG_WARN("Session", "node %s: write of command %llu failed", node_id_.c_str(),
                   static_cast<unsigned long long>(id));  // NOLINT
      return false;
    }
    return true;
  }

  /** @return true when the session has finished. */
  bool HandleMessage(const Message& msg) {
    last_traffic_ms_ = SteadyNowMs();
    last_seen_wall_ms_.store(WallNowMs());

    if (const auto* resp = std::get_if<ResponseFrame>(&msg)) {
      OnResponse(*resp);
      return false;
    }
    if (const auto* hb = std::get_if<HeartbeatFrame>(&msg)) {
      HeartbeatAckFrame ack;
      ack.timestamp_us = hb->timestamp_us;
      if (!conn_->Send(Message{ack}).has_value()) {
        Finish(NodeError::kConnectionLost, false);
        return true;
      }
      return false;
    }
    if (std::get_if<HeartbeatAckFrame>(&msg) != nullptr) return false;
    if (const auto* close = std::get_if<CloseFrame>(&msg)) {
      NGW_LOG_INFO("Session", "node %s: peer closed (%s)", node_id_.c_str(),
                   close->reason_text.c_str());
      Finish(NodeError::kConnectionLost, false);
      return true;
    }

    NGW_LOG_ERROR("Session", "node %s: unexpected frame type %u, closing",
                  node_id_.c_str(), static_cast<uint32_t>(TypeOf(msg)));
    Finish(NodeError::kProtocolViolation, true);
    return true;
  }

  void OnResponse(const ResponseFrame& resp) {
    auto it = pending_.find(resp.command_id);
    if (it == pending_.end()) {
      if (retired_set_.count(resp.command_id) != 0) {
        NGW_LOG_DEBUG("Session", "node %s: dropping late response for %llu",
                      node_id_.c_str(),
                      static_cast<unsigned long long>(resp.command_id));  // NOLINT
      } else {
        NGW_LOG_WARN("Session", "node %s: response for unknown command %llu",
                     node_id_.c_str(),
                     static_cast<unsigned long long>(resp.command_id));  // NOLINT
      }
      return;
    }
    CommandHandle slot = it->second;
    pending_.erase(it);
    pending_count_.fetch_sub(1);
    Retire(resp.command_id);

    const uint64_t now = SteadyNowMs();
    NodeResponse r = resp.ok ? NodeResponse::Success(resp.command_id, resp.result, now)
                             : NodeResponse::Failure(resp.command_id, resp.error,
                                                     resp.message, now);
    if (!slot->TryResolve(std::move(r))) {
      NGW_LOG_DEBUG("Session", "node %s: command %llu already resolved", node_id_.c_str(),
                    static_cast<unsigned long long>(resp.command_id));  // NOLINT
    }
  }

  void ExpireOverdue(uint64_t now) {
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second->DeadlineMs() <= now) {
        if (it->second->TryResolve(NodeResponse::TimedOut(it->first, now))) {
          NGW_LOG_INFO("Session", "node %s: command %llu timed out", node_id_.c_str(),
                       static_cast<unsigned long long>(it->first));  // NOLINT
        }
        Retire(it->first);
        it = pending_.erase(it);
        pending_count_.fetch_sub(1);
      } else {
        ++it;
      }
    }
  }

  void Retire(uint64_t command_id) {
    if (retired_set_.insert(command_id).second) retired_order_.push_back(command_id);
    while (retired_order_.size() > kRetiredHistory) {
      retired_set_.erase(retired_order_.front());
      retired_order_.pop_front();
    }
  }

  /**
   * @brief Terminal transition. Resolves everything still outstanding as
   *        ConnectionLost, then notifies the owner.
   * @param notify_peer Send a Close frame before dropping the connection.
   */
  void Finish(NodeError reason, bool notify_peer) {
    if (state_.load() == SessionState::kActive) state_.store(SessionState::kDraining);

    if (notify_peer) {
      CloseFrame close;
      close.reason = reason;
      close.reason_text = ToString(reason);
      static_cast<void>(conn_->Send(Message{close}));
    }
    conn_->Shutdown();
    conn_->Close();

    std::deque<Mail> leftover;
    {
      std::lock_guard<std::mutex> lock(mbox_mtx_);
      accepting_ = false;
      state_.store(SessionState::kClosed);
      leftover.swap(mailbox_);
    }

    const uint64_t now = SteadyNowMs();
    const std::string text = std::string("session closed: ") + ToString(reason);
    for (auto& kv : pending_) {
      static_cast<void>(kv.second->TryResolve(
          NodeResponse::Failure(kv.first, NodeError::kConnectionLost, text, now)));
    }
    pending_.clear();
    for (auto& mail : leftover) {
      if (mail.kind == MailKind::kSend) {
        static_cast<void>(mail.slot->TryResolve(NodeResponse::Failure(
            mail.command.command_id, NodeError::kConnectionLost, text, now)));
      }
    }
    pending_count_.store(0);

    NGW_LOG_INFO("Session", "node %s: closed (%s)", node_id_.c_str(), ToString(reason));
    if (on_closed_) on_closed_(node_id_, this, reason);
  }

  const std::string node_id_;
  std::unique_ptr<FramedConnection> conn_;
  const SessionSettings settings_;
  SessionClosedFn on_closed_;

  std::atomic<SessionState> state_{SessionState::kHandshaking};
  std::atomic<uint32_t> pending_count_{0};
  std::atomic<uint64_t> last_seen_wall_ms_{0};

  // Mailbox (any thread).
  std::mutex mbox_mtx_;
  std::deque<Mail> mailbox_;
  bool accepting_ = true;
  WakePipe wake_;

  // Session-thread only.
  std::unordered_map<uint64_t, CommandHandle> pending_;
  std::unordered_set<uint64_t> retired_set_;
  std::deque<uint64_t> retired_order_;
  uint64_t last_traffic_ms_ = 0;

  std::thread thread_;
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_SESSION_HPP_
