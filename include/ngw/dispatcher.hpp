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
 * @file dispatcher.hpp
 * @brief Public command API: send, broadcast and cancel.
 *
 * Commands are never queued for offline nodes. A node without a live
 * session fails with kNodeNotConnected at once, whatever the timeout.
 */

#ifndef NGW_DISPATCHER_HPP_
#define NGW_DISPATCHER_HPP_

#include "ngw/audit.hpp"
#include "ngw/log.hpp"
#include "ngw/registry.hpp"
#include "ngw/session.hpp"
#include "ngw/types.hpp"

#if NGW_HAS_NETWORK

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ngw {

/** @brief A command on the wire whose result has not been collected yet. */
struct PendingCommand {
  uint64_t command_id = 0;
  std::string node_id;
  CommandHandle slot;
};

class CommandDispatcher {
 public:
  CommandDispatcher(ConnectionRegistry& registry, uint32_t default_timeout_ms,
                    AuditSink* audit = nullptr)
      : registry_(registry), default_timeout_ms_(default_timeout_ms), audit_(audit) {}

  CommandDispatcher(const CommandDispatcher&) = delete;
  CommandDispatcher& operator=(const CommandDispatcher&) = delete;

  /**
   * @brief Send @p payload to one node and wait for its response.
   *
   * @param timeout_ms 0 selects the configured default.
   * @return The resolved NodeResponse (Success, Failure or Timeout), or
   *         kNodeNotConnected when the node has no live session.
   */
  expected<NodeResponse, NodeError> Send(const std::string& node_id,
                                         const std::string& payload,
                                         uint32_t timeout_ms = 0) {
    auto pending = SendAsync(node_id, payload, timeout_ms);
    if (!pending.has_value()) {
      return expected<NodeResponse, NodeError>::error(pending.get_error());
    }
    return expected<NodeResponse, NodeError>::success(Await(pending.value()));
  }

  /** @brief Put a command on the wire without waiting. Pair with Await(). */
  expected<PendingCommand, NodeError> SendAsync(const std::string& node_id,
                                                const std::string& payload,
                                                uint32_t timeout_ms = 0) {
    using R = expected<PendingCommand, NodeError>;
    std::shared_ptr<NodeSession> session = registry_.DispatchTarget(node_id);
    if (!session) {
      NGW_LOG_DEBUG("Dispatch", "node %s not connected", node_id.c_str());
      return R::error(NodeError::kNodeNotConnected);
    }

    NodeCommand cmd;
    cmd.command_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    cmd.node_id = node_id;
    cmd.payload = payload;
    cmd.issued_at_ms = SteadyNowMs();
    cmd.timeout_ms = (timeout_ms != 0U) ? timeout_ms : default_timeout_ms_;

    PendingCommand pc;
    pc.command_id = cmd.command_id;
    pc.node_id = node_id;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      PruneResolvedLocked();
      pc.slot = session->SendCommand(cmd);
      in_flight_.emplace(cmd.command_id, InFlight{pc.slot, session});
    }
    NGW_LOG_DEBUG("Dispatch", "command %llu -> node %s (timeout %u ms)",
                  static_cast<unsigned long long>(cmd.command_id),  // NOLINT
                  node_id.c_str(), cmd.timeout_ms);
    detail::Audit(audit_, AuditKind::kDispatched, node_id, "", cmd.command_id);
    return R::success(std::move(pc));
  }

  /** @brief Wait for a command issued by SendAsync(). */
  NodeResponse Await(const PendingCommand& pc) {
    NodeResponse r = pc.slot->Wait();
    std::lock_guard<std::mutex> lock(mtx_);
    in_flight_.erase(pc.command_id);
    return r;
  }

  /**
   * @brief Send to every Connected node concurrently and join the results.
   *
   * Total latency is bounded by the slowest node's timeout.
   */
  std::map<std::string, NodeResponse> Broadcast(const std::string& payload,
                                                uint32_t timeout_ms = 0) {
    std::map<std::string, NodeResponse> results;
    std::vector<PendingCommand> issued;
    for (const auto& node_id : registry_.ConnectedIds()) {
      auto pc = SendAsync(node_id, payload, timeout_ms);
      if (pc.has_value()) {
        issued.push_back(std::move(pc.value()));
      } else {
        // Disconnected between listing and sending.
        results[node_id] = NodeResponse::Failure(0, pc.get_error(),
                                                 ToString(pc.get_error()), SteadyNowMs());
      }
    }
    for (const auto& pc : issued) results[pc.node_id] = Await(pc);
    NGW_LOG_INFO("Dispatch", "broadcast to %zu nodes complete", results.size());
    return results;
  }

  /**
   * @brief Best-effort cancel.
   * @return true if this call resolved the command as Cancelled.
   */
  bool Cancel(uint64_t command_id) {
    CommandHandle slot;
    std::shared_ptr<NodeSession> session;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = in_flight_.find(command_id);
      if (it == in_flight_.end()) return false;
      slot = it->second.slot;
      session = it->second.session.lock();
    }
    const bool won = slot->TryResolve(NodeResponse::Failure(
        command_id, NodeError::kCancelled, "cancelled", SteadyNowMs()));
    {
      // Resolved either way; the caller's handle still holds the result.
      std::lock_guard<std::mutex> lock(mtx_);
      in_flight_.erase(command_id);
    }
    if (won && session) session->Cancel(command_id);
    NGW_LOG_DEBUG("Dispatch", "cancel %llu: %s",
                  static_cast<unsigned long long>(command_id),  // NOLINT
                  won ? "cancelled" : "already resolved");
    return won;
  }

  /**
   * @brief Commands still awaiting resolution. Entries resolved without
   *        an Await() are dropped here and on every SendAsync().
   */
  uint32_t InFlightCount() {
    std::lock_guard<std::mutex> lock(mtx_);
    PruneResolvedLocked();
    return static_cast<uint32_t>(in_flight_.size());
  }

  uint32_t DefaultTimeoutMs() const noexcept { return default_timeout_ms_; }

 private:
  struct InFlight {
    CommandHandle slot;
    std::weak_ptr<NodeSession> session;
  };

  void PruneResolvedLocked() {
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
      if (it->second.slot->IsResolved()) {
        it = in_flight_.erase(it);
      } else {
        ++it;
      }
    }
  }

  ConnectionRegistry& registry_;
  const uint32_t default_timeout_ms_;
  AuditSink* audit_;
  std::atomic<uint64_t> next_id_{1};
  mutable std::mutex mtx_;
  std::unordered_map<uint64_t, InFlight> in_flight_;
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_DISPATCHER_HPP_
