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
 * @file pairing.hpp
 * @brief Issues and consumes single-use six-digit pairing codes.
 *
 * A consumed code stays in the table until its TTL runs out so a replay
 * reports kCodeAlreadyUsed instead of kCodeNotFound.
 */

#ifndef NGW_PAIRING_HPP_
#define NGW_PAIRING_HPP_

#include "ngw/audit.hpp"
#include "ngw/config.hpp"
#include "ngw/log.hpp"
#include "ngw/registry.hpp"
#include "ngw/session.hpp"
#include "ngw/transport.hpp"
#include "ngw/types.hpp"

#if NGW_HAS_NETWORK

#include <cstdint>
#include <cstdio>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace ngw {

constexpr uint32_t kPairingCodeSpace = 1000000U;  ///< "000000".."999999"

namespace detail {

/** @brief Thread-safe source of random 64-bit words. */
inline uint64_t RandomU64() {
  static std::mutex mtx;
  static std::mt19937_64 engine{[] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }()};
  std::lock_guard<std::mutex> lock(mtx);
  return engine();
}

/** @brief Random RFC 4122 version-4 UUID string. */
inline std::string NewNodeId() {
  uint64_t hi = RandomU64();
  uint64_t lo = RandomU64();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10
  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<uint32_t>(hi >> 32), static_cast<uint32_t>((hi >> 16) & 0xFFFFU),
                static_cast<uint32_t>(hi & 0xFFFFU), static_cast<uint32_t>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));  // NOLINT
  return std::string(buf);
}

/** @brief 128-bit random session token, hex encoded. */
inline std::string NewSessionToken() {
  char buf[33];
  std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                static_cast<unsigned long long>(RandomU64()),   // NOLINT
                static_cast<unsigned long long>(RandomU64()));  // NOLINT
  return std::string(buf);
}

/** @brief "482913" -> "482***" for logs at INFO and above. */
inline std::string MaskCode(const std::string& code) {
  if (code.size() <= 3) return std::string("***");
  return code.substr(0, 3) + "***";
}

}  // namespace detail

// ============================================================================
// PairingCodeIssuer
// ============================================================================

class PairingCodeIssuer {
 public:
  /// Draws a raw value; the issuer reduces it modulo the code space.
  using CodeGenerator = std::function<uint32_t()>;

  PairingCodeIssuer(ConnectionRegistry& registry, const PairingSettings& pairing,
                    const SessionSettings& session, AuditSink* audit = nullptr)
      : registry_(registry), pairing_(pairing), session_(session), audit_(audit),
        generator_([] { return static_cast<uint32_t>(detail::RandomU64()); }) {}

  PairingCodeIssuer(const PairingCodeIssuer&) = delete;
  PairingCodeIssuer& operator=(const PairingCodeIssuer&) = delete;

  /** @brief Replace the random source (tests use this to force collisions). */
  void SetGenerator(CodeGenerator gen) {
    std::lock_guard<std::mutex> lock(mtx_);
    generator_ = std::move(gen);
  }

  /**
   * @brief Mint a fresh code valid for code_ttl_ms.
   *
   * Draws up to max_issue_retries random codes, then walks the code space
   * from the last draw to the first free code.
   * @return kCodeSpaceExhausted only when every code is live.
   */
  expected<PairingRequest, NodeError> Issue(const std::string& hint = std::string()) {
    using R = expected<PairingRequest, NodeError>;
    std::lock_guard<std::mutex> lock(mtx_);
    if (codes_.size() >= kPairingCodeSpace) {
      NGW_LOG_ERROR("Pairing", "code space exhausted (%zu codes live)", codes_.size());
      return R::error(NodeError::kCodeSpaceExhausted);
    }

    uint32_t value = 0;
    bool found = false;
    for (uint32_t attempt = 0; attempt < pairing_.max_issue_retries && !found; ++attempt) {
      value = generator_() % kPairingCodeSpace;
      found = codes_.count(FormatCode(value)) == 0;
    }
    if (!found) {
      NGW_LOG_DEBUG("Pairing", "%u collisions, scanning for a free code",
                    pairing_.max_issue_retries);
      for (uint32_t step = 1; step <= kPairingCodeSpace && !found; ++step) {
        const uint32_t candidate = (value + step) % kPairingCodeSpace;
        if (codes_.count(FormatCode(candidate)) == 0) {
          value = candidate;
          found = true;
        }
      }
    }
    if (!found) return R::error(NodeError::kCodeSpaceExhausted);

    const uint64_t now = SteadyNowMs();
    Record rec;
    rec.request.code = FormatCode(value);
    rec.request.hint = hint;
    rec.request.requested_at_ms = now;
    rec.request.expires_at_ms = now + pairing_.code_ttl_ms;
    codes_.emplace(rec.request.code, rec);
    NGW_LOG_INFO("Pairing", "issued code %s (ttl %u ms)%s%s",
                 detail::MaskCode(rec.request.code).c_str(), pairing_.code_ttl_ms,
                 hint.empty() ? "" : " for ", hint.c_str());
    return R::success(rec.request);
  }

  /**
   * @brief Redeem @p code for a new node on @p conn.
   *
   * On success the connection now belongs to a started NodeSession that is
   * Connected in the registry. @p conn is left untouched when the code
   * itself is rejected, so the caller can still answer on it.
   */
  expected<NodeInfo, NodeError> Consume(const std::string& code,
                                        std::unique_ptr<FramedConnection>& conn,
                                        const NodeHello& hello) {
    using R = expected<NodeInfo, NodeError>;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = codes_.find(code);
      if (it == codes_.end()) {
        NGW_LOG_WARN("Pairing", "unknown code %s", detail::MaskCode(code).c_str());
        return R::error(NodeError::kCodeNotFound);
      }
      if (it->second.consumed) {
        NGW_LOG_WARN("Pairing", "code %s replayed", detail::MaskCode(code).c_str());
        return R::error(NodeError::kCodeAlreadyUsed);
      }
      if (SteadyNowMs() >= it->second.request.expires_at_ms) {
        codes_.erase(it);
        NGW_LOG_WARN("Pairing", "code %s expired", detail::MaskCode(code).c_str());
        return R::error(NodeError::kCodeExpired);
      }
      it->second.consumed = true;
    }

    NodeInfo info;
    info.node_id = detail::NewNodeId();
    info.display_name = hello.display_name.empty() ? info.node_id : hello.display_name;
    info.hostname = hello.hostname;
    info.platform = hello.platform;
    info.capabilities = hello.capabilities;
    info.paired_at_ms = WallNowMs();
    info.last_seen_ms = info.paired_at_ms;
    info.connection_state = ConnectionState::kPending;
    const std::string token = detail::NewSessionToken();

    auto session = std::make_shared<NodeSession>(info.node_id, std::move(conn), session_,
                                                 registry_.ClosedHook());
    auto reg = registry_.Register(info, session, token);
    if (!reg.has_value()) {
      session->Reject(PairingResponse::Rejected(reg.get_error()));
      return R::error(reg.get_error());
    }

    auto started = session->Start(PairingResponse::Accepted(info.node_id, token));
    if (!started.has_value()) {
      static_cast<void>(registry_.RemovePending(info.node_id));
      return R::error(NodeError::kConnectionLost);
    }
    auto activated = registry_.Activate(info.node_id);
    if (!activated.has_value()) {
      // The session died between Start() and here.
      static_cast<void>(registry_.RemovePending(info.node_id));
      return R::error(NodeError::kConnectionLost);
    }

    info.connection_state = ConnectionState::kConnected;
    NGW_LOG_INFO("Pairing", "node %s (%s) paired", info.node_id.c_str(),
                 info.display_name.c_str());
    detail::Audit(audit_, AuditKind::kPaired, info.node_id, info.display_name);
    return R::success(std::move(info));
  }

  /**
   * @brief Drop every code whose TTL has passed, consumed or not.
   * @return Number of codes removed.
   */
  uint32_t ExpireSweep() {
    std::lock_guard<std::mutex> lock(mtx_);
    const uint64_t now = SteadyNowMs();
    uint32_t removed = 0;
    for (auto it = codes_.begin(); it != codes_.end();) {
      if (now >= it->second.request.expires_at_ms) {
        it = codes_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    if (removed > 0) NGW_LOG_DEBUG("Pairing", "sweep removed %u codes", removed);
    return removed;
  }

  /** @brief Codes still redeemable (unconsumed and inside their TTL). */
  uint32_t ActiveCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    const uint64_t now = SteadyNowMs();
    uint32_t n = 0;
    for (const auto& kv : codes_) {
      if (!kv.second.consumed && now < kv.second.request.expires_at_ms) ++n;
    }
    return n;
  }

  bool IsActive(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = codes_.find(code);
    return it != codes_.end() && !it->second.consumed &&
           SteadyNowMs() < it->second.request.expires_at_ms;
  }

 private:
  struct Record {
    PairingRequest request;
    bool consumed = false;
  };

  static std::string FormatCode(uint32_t value) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%06u", value);
    return std::string(buf);
  }

  ConnectionRegistry& registry_;
  const PairingSettings pairing_;
  const SessionSettings session_;
  AuditSink* audit_;
  mutable std::mutex mtx_;
  std::map<std::string, Record> codes_;
  CodeGenerator generator_;
};

}  // namespace ngw

#endif  // NGW_HAS_NETWORK

#endif  // NGW_PAIRING_HPP_
