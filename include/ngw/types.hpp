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
 * @file types.hpp
 * @brief Domain types shared by the gateway and the node agent.
 *
 * Everything here is a plain value type. NodeInfo instances handed out by
 * the registry are snapshots; mutating them never affects registry state.
 */

#ifndef NGW_TYPES_HPP_
#define NGW_TYPES_HPP_

#include "ngw/platform.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ngw {

// ============================================================================
// NodeError
// ============================================================================

enum class NodeError : uint8_t {
  kCodeNotFound = 1,
  kCodeExpired,
  kCodeAlreadyUsed,
  kCodeSpaceExhausted,
  kDuplicateNode,
  kNodeNotConnected,
  kConnectionLost,
  kTimeout,
  kCancelled,
  kProtocolViolation,
  kCommandFailed,    ///< Node ran the command and reported failure.
  kTokenRejected,    ///< Reconnect token unknown or purged.
  kCapacityReached,  ///< max_nodes entries already registered.
  kBindFailed,
  kConnectFailed,
  kNotRunning,
};

/** @brief Stable snake_case name, used in logs and Rejected reasons. */
inline const char* ToString(NodeError e) noexcept {
  switch (e) {
    case NodeError::kCodeNotFound:       return "code_not_found";
    case NodeError::kCodeExpired:        return "code_expired";
    case NodeError::kCodeAlreadyUsed:    return "code_already_used";
    case NodeError::kCodeSpaceExhausted: return "code_space_exhausted";
    case NodeError::kDuplicateNode:      return "duplicate_node";
    case NodeError::kNodeNotConnected:   return "node_not_connected";
    case NodeError::kConnectionLost:     return "connection_lost";
    case NodeError::kTimeout:            return "timeout";
    case NodeError::kCancelled:          return "cancelled";
    case NodeError::kProtocolViolation:  return "protocol_violation";
    case NodeError::kCommandFailed:      return "command_failed";
    case NodeError::kTokenRejected:      return "token_rejected";
    case NodeError::kCapacityReached:    return "capacity_reached";
    case NodeError::kBindFailed:         return "bind_failed";
    case NodeError::kConnectFailed:      return "connect_failed";
    case NodeError::kNotRunning:         return "not_running";
  }
  return "unknown";
}

/** @brief Wire values outside the enum range decode as kProtocolViolation. */
inline NodeError NodeErrorFromWire(uint8_t raw) noexcept {
  if (raw < static_cast<uint8_t>(NodeError::kCodeNotFound) ||
      raw > static_cast<uint8_t>(NodeError::kNotRunning)) {
    return NodeError::kProtocolViolation;
  }
  return static_cast<NodeError>(raw);
}

// ============================================================================
// Node lifecycle
// ============================================================================

/** Registry view of a node. Moves Pending -> Connected -> Disconnected. */
enum class ConnectionState : uint8_t { kPending = 0, kConnected, kDisconnected };

inline const char* ToString(ConnectionState s) noexcept {
  switch (s) {
    case ConnectionState::kPending:      return "pending";
    case ConnectionState::kConnected:    return "connected";
    case ConnectionState::kDisconnected: return "disconnected";
  }
  return "unknown";
}

/** Gateway-side session actor state. kClosed is terminal. */
enum class SessionState : uint8_t { kHandshaking = 0, kActive, kDraining, kClosed };

inline const char* ToString(SessionState s) noexcept {
  switch (s) {
    case SessionState::kHandshaking: return "handshaking";
    case SessionState::kActive:      return "active";
    case SessionState::kDraining:    return "draining";
    case SessionState::kClosed:      return "closed";
  }
  return "unknown";
}

struct NodeInfo {
  std::string node_id;
  std::string display_name;
  std::string hostname;
  std::string platform;
  uint64_t paired_at_ms = 0;  ///< Wall clock, ms since epoch.
  uint64_t last_seen_ms = 0;  ///< Wall clock, ms since epoch.
  ConnectionState connection_state = ConnectionState::kPending;
  std::vector<std::string> capabilities;
};

/** What a node tells the gateway about itself when it pairs. */
struct NodeHello {
  std::string display_name;
  std::string hostname;
  std::string platform;
  std::vector<std::string> capabilities;
};

// ============================================================================
// Pairing
// ============================================================================

struct PairingRequest {
  std::string code;         ///< Exactly six decimal digits.
  std::string hint;         ///< Optional operator note (e.g. expected node name).
  uint64_t requested_at_ms = 0;  ///< Steady clock.
  uint64_t expires_at_ms = 0;    ///< Steady clock.
};

struct PairingResponse {
  bool accepted = false;
  std::string node_id;        ///< Set when accepted.
  std::string session_token;  ///< Set when accepted.
  NodeError reason = NodeError::kCodeNotFound;  ///< Set when rejected.
  std::string reason_text;                      ///< Set when rejected.

  static PairingResponse Accepted(const std::string& node_id,
                                  const std::string& token) {
    PairingResponse r;
    r.accepted = true;
    r.node_id = node_id;
    r.session_token = token;
    return r;
  }

  static PairingResponse Rejected(NodeError reason) {
    PairingResponse r;
    r.accepted = false;
    r.reason = reason;
    r.reason_text = ToString(reason);
    return r;
  }
};

// ============================================================================
// Commands
// ============================================================================

struct NodeCommand {
  uint64_t command_id = 0;
  std::string node_id;
  std::string payload;
  uint64_t issued_at_ms = 0;  ///< Steady clock.
  uint32_t timeout_ms = 0;
};

enum class ResponseStatus : uint8_t { kSuccess = 0, kFailure, kTimeout };

inline const char* ToString(ResponseStatus s) noexcept {
  switch (s) {
    case ResponseStatus::kSuccess: return "success";
    case ResponseStatus::kFailure: return "failure";
    case ResponseStatus::kTimeout: return "timeout";
  }
  return "unknown";
}

struct NodeResponse {
  uint64_t command_id = 0;
  ResponseStatus status = ResponseStatus::kTimeout;
  std::string result;                           ///< kSuccess only.
  NodeError failure = NodeError::kCommandFailed;  ///< kFailure only.
  std::string message;                          ///< kFailure only.
  uint64_t completed_at_ms = 0;                 ///< Steady clock.

  bool ok() const noexcept { return status == ResponseStatus::kSuccess; }

  static NodeResponse Success(uint64_t id, std::string result_text, uint64_t now_ms) {
    NodeResponse r;
    r.command_id = id;
    r.status = ResponseStatus::kSuccess;
    r.result = std::move(result_text);
    r.completed_at_ms = now_ms;
    return r;
  }

  static NodeResponse Failure(uint64_t id, NodeError kind, std::string msg,
                              uint64_t now_ms) {
    NodeResponse r;
    r.command_id = id;
    r.status = ResponseStatus::kFailure;
    r.failure = kind;
    r.message = std::move(msg);
    r.completed_at_ms = now_ms;
    return r;
  }

  static NodeResponse TimedOut(uint64_t id, uint64_t now_ms) {
    NodeResponse r;
    r.command_id = id;
    r.status = ResponseStatus::kTimeout;
    r.completed_at_ms = now_ms;
    return r;
  }
};

}  // namespace ngw

#endif  // NGW_TYPES_HPP_
