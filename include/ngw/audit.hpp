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
 * @file audit.hpp
 * @brief Fire-and-forget audit reporting for pairing, disconnect and dispatch.
 */

#ifndef NGW_AUDIT_HPP_
#define NGW_AUDIT_HPP_

#include "ngw/log.hpp"
#include "ngw/types.hpp"
#include "ngw/vocabulary.hpp"

#include <cstdint>
#include <string>

namespace ngw {

enum class AuditKind : uint8_t { kPaired = 0, kDisconnected, kPurged, kDispatched };

inline const char* ToString(AuditKind k) noexcept {
  switch (k) {
    case AuditKind::kPaired:       return "paired";
    case AuditKind::kDisconnected: return "disconnected";
    case AuditKind::kPurged:       return "purged";
    case AuditKind::kDispatched:   return "dispatched";
  }
  return "unknown";
}

struct AuditEvent {
  AuditKind kind = AuditKind::kPaired;
  std::string node_id;
  uint64_t command_id = 0;  ///< kDispatched only.
  std::string detail;
  uint64_t at_ms = 0;       ///< Wall clock.
};

/**
 * @brief Audit collaborator interface.
 *
 * Record() returns false when the write failed. Callers log that at WARN
 * and carry on; an audit failure never changes an operation's outcome.
 */
class AuditSink {
 public:
  virtual ~AuditSink() = default;
  virtual bool Record(const AuditEvent& event) = 0;
};

/** @brief Default sink: one INFO line per event under the "Audit" category. */
class LogAuditSink final : public AuditSink {
 public:
  bool Record(const AuditEvent& event) override {
    if (event.kind == AuditKind::kDispatched) {
      NGW_LOG_INFO("Audit", "%s node=%s cmd=%llu %s", ToString(event.kind),
                   event.node_id.c_str(),
                   static_cast<unsigned long long>(event.command_id),  // NOLINT
                   event.detail.c_str());
    } else {
      NGW_LOG_INFO("Audit", "%s node=%s %s", ToString(event.kind),
                   event.node_id.c_str(), event.detail.c_str());
    }
    return true;
  }
};

namespace detail {

/** @brief Report through @p sink (may be null); failures only warn. */
inline void Audit(AuditSink* sink, AuditKind kind, const std::string& node_id,
                  const std::string& detail, uint64_t command_id = 0) {
  if (sink == nullptr) return;
  AuditEvent ev;
  ev.kind = kind;
  ev.node_id = node_id;
  ev.command_id = command_id;
  ev.detail = detail;
  ev.at_ms = WallNowMs();
  if (!sink->Record(ev)) {
    NGW_LOG_WARN("Audit", "audit write failed for %s event on node %s",
                 ToString(kind), node_id.c_str());
  }
}

}  // namespace detail

}  // namespace ngw

#endif  // NGW_AUDIT_HPP_
