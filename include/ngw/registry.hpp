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
 * @file registry.hpp
 * @brief Authoritative map of known nodes and their live sessions.
 *
 * The registry lock is a short critical section: lookups, inserts and
 * removals only. Sessions that leave the registry are moved out and
 * destroyed after the lock is released, since destroying a session joins
 * its thread.
 */

#ifndef NGW_REGISTRY_HPP_
#define NGW_REGISTRY_HPP_

#include "ngw/audit.hpp"
#include "ngw/config.hpp"
#include "ngw/log.hpp"
#include "ngw/session.hpp"
#include "ngw/types.hpp"

#if NGW_HAS_NETWORK

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ngw {

class ConnectionRegistry {
 public:
  ConnectionRegistry(const SessionSettings& settings, uint32_t max_nodes,
                     AuditSink* audit = nullptr)
      : settings_(settings), max_nodes_(max_nodes), audit_(audit) {}

  ~ConnectionRegistry() { Clear(); }

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  /**
   * @brief Callback to hand to every NodeSession this registry will own.
   *
   * Routes the session's close notification to MarkDisconnected().
   */
  SessionClosedFn ClosedHook() {
    return [this](const std::string& node_id, NodeSession* session, NodeError reason) {
      MarkDisconnected(node_id, session, reason);
    };
  }

  /**
   * @brief Insert a new node.
   *
   * A Disconnected entry with the same node_id is replaced.
   * @return kDuplicateNode if the node_id is Pending or Connected,
   *         kCapacityReached when max_nodes entries already exist.
   */
  expected<void, NodeError> Register(const NodeInfo& info,
                                     std::shared_ptr<NodeSession> session,
                                     const std::string& token) {
    std::shared_ptr<NodeSession> evicted;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = entries_.find(info.node_id);
      if (it != entries_.end()) {
        if (it->second.info.connection_state != ConnectionState::kDisconnected) {
          NGW_LOG_WARN("Registry", "duplicate node_id %s rejected", info.node_id.c_str());
          return expected<void, NodeError>::error(NodeError::kDuplicateNode);
        }
        evicted = std::move(it->second.session);
        entries_.erase(it);
      } else if (entries_.size() >= max_nodes_) {
        NGW_LOG_WARN("Registry", "capacity reached (%u nodes)", max_nodes_);
        return expected<void, NodeError>::error(NodeError::kCapacityReached);
      }
      Entry e;
      e.info = info;
      e.session = std::move(session);
      e.token = token;
      e.pending_since_ms = SteadyNowMs();
      entries_.emplace(info.node_id, std::move(e));
    }
    NGW_LOG_DEBUG("Registry", "node %s registered (%s)", info.node_id.c_str(),
                  ToString(info.connection_state));
    return expected<void, NodeError>::success();
  }

  /** @brief Pending -> Connected once the handshake reply went out. */
  expected<void, NodeError> Activate(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(node_id);
    if (it == entries_.end() ||
        it->second.info.connection_state != ConnectionState::kPending) {
      return expected<void, NodeError>::error(NodeError::kNodeNotConnected);
    }
    // A session that closed before activation already fired its close hook,
    // which ignored the Pending entry.
    if (!it->second.session || it->second.session->State() == SessionState::kClosed) {
      return expected<void, NodeError>::error(NodeError::kConnectionLost);
    }
    it->second.info.connection_state = ConnectionState::kConnected;
    it->second.info.last_seen_ms = WallNowMs();
    NGW_LOG_INFO("Registry", "node %s connected", node_id.c_str());
    return expected<void, NodeError>::success();
  }

  /** @brief Drop a Pending entry whose handshake never completed. */
  bool RemovePending(const std::string& node_id) {
    std::shared_ptr<NodeSession> dropped;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = entries_.find(node_id);
      if (it == entries_.end() ||
          it->second.info.connection_state != ConnectionState::kPending) {
        return false;
      }
      dropped = std::move(it->second.session);
      entries_.erase(it);
    }
    NGW_LOG_INFO("Registry", "pending node %s removed", node_id.c_str());
    return true;
  }

  /** @brief Snapshot of one node. */
  optional<NodeInfo> Get(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(node_id);
    if (it == entries_.end()) return {};
    return optional<NodeInfo>{Snapshot(it->second)};
  }

  std::vector<NodeInfo> List() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<NodeInfo> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(Snapshot(kv.second));
    return out;
  }

  std::vector<std::string> ConnectedIds() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    for (const auto& kv : entries_) {
      if (kv.second.info.connection_state == ConnectionState::kConnected) {
        out.push_back(kv.first);
      }
    }
    return out;
  }

  bool IsConnected(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(node_id);
    return it != entries_.end() &&
           it->second.info.connection_state == ConnectionState::kConnected;
  }

  /**
   * @brief Connected -> Disconnected and start the grace timer.
   *
   * Ignored unless @p session is the entry's current session, so a
   * superseded session closing late cannot disconnect its replacement.
   * A null @p session matches any.
   */
  void MarkDisconnected(const std::string& node_id, const NodeSession* session,
                        NodeError reason = NodeError::kConnectionLost) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = entries_.find(node_id);
      if (it == entries_.end()) return;
      Entry& e = it->second;
      if (session != nullptr && e.session.get() != session) return;
      if (e.info.connection_state != ConnectionState::kConnected) return;
      e.info.connection_state = ConnectionState::kDisconnected;
      if (e.session) e.info.last_seen_ms = e.session->LastSeenMs();
      e.disconnected_at_ms = SteadyNowMs();
    }
    NGW_LOG_INFO("Registry", "node %s disconnected (%s), grace %u ms", node_id.c_str(),
                 ToString(reason), settings_.grace_period_ms);
    detail::Audit(audit_, AuditKind::kDisconnected, node_id, ToString(reason));
  }

  /** @brief Remove one entry regardless of state. */
  bool Purge(const std::string& node_id) {
    std::shared_ptr<NodeSession> dropped;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = entries_.find(node_id);
      if (it == entries_.end()) return false;
      dropped = std::move(it->second.session);
      entries_.erase(it);
    }
    NGW_LOG_INFO("Registry", "node %s purged", node_id.c_str());
    detail::Audit(audit_, AuditKind::kPurged, node_id, "");
    return true;
  }

  /**
   * @brief Purge Disconnected entries past the grace period and Pending
   *        entries older than pending_timeout_ms.
   * @return Number of entries removed.
   */
  uint32_t PurgeExpired() {
    std::vector<std::shared_ptr<NodeSession>> dropped;
    std::vector<std::string> purged;
    std::vector<std::string> stale;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      const uint64_t now = SteadyNowMs();
      for (auto it = entries_.begin(); it != entries_.end();) {
        const Entry& e = it->second;
        bool remove = false;
        if (e.info.connection_state == ConnectionState::kDisconnected &&
            now - e.disconnected_at_ms >= settings_.grace_period_ms) {
          purged.push_back(it->first);
          remove = true;
        } else if (e.info.connection_state == ConnectionState::kPending &&
                   now - e.pending_since_ms >= settings_.pending_timeout_ms) {
          stale.push_back(it->first);
          remove = true;
        }
        if (remove) {
          dropped.push_back(std::move(it->second.session));
          it = entries_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (const auto& id : stale) {
      NGW_LOG_WARN("Registry", "pending node %s never completed, removed", id.c_str());
    }
    for (const auto& id : purged) {
      NGW_LOG_INFO("Registry", "node %s purged after grace period", id.c_str());
      detail::Audit(audit_, AuditKind::kPurged, id, "grace period elapsed");
    }
    return static_cast<uint32_t>(purged.size() + stale.size());
  }

  /**
   * @brief Live session for dispatch. Only Connected nodes with an active
   *        session qualify.
   */
  std::shared_ptr<NodeSession> DispatchTarget(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(node_id);
    if (it == entries_.end() ||
        it->second.info.connection_state != ConnectionState::kConnected ||
        !it->second.session || !it->second.session->IsActive()) {
      return nullptr;
    }
    return it->second.session;
  }

  /** @brief node_id holding @p token, if the entry still exists. */
  optional<std::string> FindByToken(const std::string& token) const {
    if (token.empty()) return {};
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& kv : entries_) {
      if (kv.second.token == token) return optional<std::string>{kv.first};
    }
    return {};
  }

  /**
   * @brief Re-attach a node that presents its session token.
   *
   * Starts a new lifecycle for the node_id: the entry goes back to Pending
   * with @p session, and any previous session is closed.
   * @return kTokenRejected if no entry holds the token.
   */
  expected<NodeInfo, NodeError> Resume(const std::string& token, const NodeHello& hello,
                                       std::shared_ptr<NodeSession> session) {
    std::shared_ptr<NodeSession> previous;
    NodeInfo snapshot;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = entries_.end();
      for (auto cur = entries_.begin(); cur != entries_.end(); ++cur) {
        if (!token.empty() && cur->second.token == token) {
          it = cur;
          break;
        }
      }
      if (it == entries_.end() || it->first != session->NodeId()) {
        return expected<NodeInfo, NodeError>::error(NodeError::kTokenRejected);
      }
      Entry& e = it->second;
      previous = std::move(e.session);
      e.session = std::move(session);
      e.info.connection_state = ConnectionState::kPending;
      if (!hello.display_name.empty()) e.info.display_name = hello.display_name;
      if (!hello.hostname.empty()) e.info.hostname = hello.hostname;
      if (!hello.platform.empty()) e.info.platform = hello.platform;
      if (!hello.capabilities.empty()) e.info.capabilities = hello.capabilities;
      e.pending_since_ms = SteadyNowMs();
      e.disconnected_at_ms = 0;
      snapshot = e.info;
    }
    if (previous) previous->RequestStop(NodeError::kDuplicateNode);
    NGW_LOG_INFO("Registry", "node %s resuming by token", snapshot.node_id.c_str());
    return expected<NodeInfo, NodeError>::success(std::move(snapshot));
  }

  /** @brief Drain every live session (shutdown path). */
  void DrainAll() {
    for (auto& s : Sessions()) s->Drain();
  }

  /** @brief Total in-flight commands across all sessions. */
  uint32_t PendingCommands() const {
    uint32_t total = 0;
    for (const auto& s : Sessions()) total += s->PendingCount();
    return total;
  }

  /** @brief Remove every entry, closing all sessions. */
  void Clear() {
    std::map<std::string, Entry> old;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      old.swap(entries_);
    }
    for (auto& kv : old) {
      if (kv.second.session) kv.second.session->RequestStop(NodeError::kNotRunning);
    }
    // A session stuck writing to a node that stopped reading never gets to
    // its mailbox; cut its link once the others had their chance.
    const uint64_t deadline = SteadyNowMs() + NodeSession::kStopWaitMs;
    for (auto& kv : old) {
      if (!kv.second.session) continue;
      const uint64_t now = SteadyNowMs();
      const uint32_t left = (deadline > now) ? static_cast<uint32_t>(deadline - now) : 0U;
      if (!kv.second.session->WaitClosed(left)) {
        NGW_LOG_WARN("Registry", "node %s: force-closing unresponsive session",
                     kv.first.c_str());
        kv.second.session->ForceClose();
      }
    }
    // Session destructors join outside the lock; their close hooks find
    // no entry and return.
    old.clear();
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<uint32_t>(entries_.size());
  }

  uint32_t MaxNodes() const noexcept { return max_nodes_; }

 private:
  struct Entry {
    NodeInfo info;
    std::shared_ptr<NodeSession> session;
    std::string token;
    uint64_t pending_since_ms = 0;    ///< Steady clock.
    uint64_t disconnected_at_ms = 0;  ///< Steady clock.
  };

  static NodeInfo Snapshot(const Entry& e) {
    NodeInfo info = e.info;
    if (info.connection_state == ConnectionState::kConnected && e.session) {
      const uint64_t seen = e.session->LastSeenMs();
      if (seen > info.last_seen_ms) info.last_seen_ms = seen;
    }
    return info;
  }

  std::vector<std::shared_ptr<NodeSession>> Sessions() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::shared_ptr<NodeSession>> out;
    for (const auto& kv : entries_) {
      if (kv.second.session) out.push_back(kv.second.session);
    }
    return out;
  }

  const SessionSettings settings_;
  const uint32_t max_nodes_;
  AuditSink* audit_;
  mutable std::mutex mtx_;
  std::map<std::string, Entry> entries_;
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_REGISTRY_HPP_
