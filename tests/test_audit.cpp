/**
 * @file test_audit.cpp
 * @brief Tests for audit.hpp: event names, the log sink and failure handling.
 */

#include "ngw/audit.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <vector>

namespace {

class VectorSink final : public ngw::AuditSink {
 public:
  explicit VectorSink(bool ok) : ok_(ok) {}
  bool Record(const ngw::AuditEvent& event) override {
    events.push_back(event);
    return ok_;
  }
  std::vector<ngw::AuditEvent> events;

 private:
  bool ok_;
};

}  // namespace

TEST_CASE("audit - kind names", "[audit]") {
  CHECK(std::strcmp(ngw::ToString(ngw::AuditKind::kPaired), "paired") == 0);
  CHECK(std::strcmp(ngw::ToString(ngw::AuditKind::kDisconnected), "disconnected") == 0);
  CHECK(std::strcmp(ngw::ToString(ngw::AuditKind::kPurged), "purged") == 0);
  CHECK(std::strcmp(ngw::ToString(ngw::AuditKind::kDispatched), "dispatched") == 0);
}

TEST_CASE("audit - events carry node, command and a wall timestamp", "[audit]") {
  VectorSink sink(true);
  const uint64_t before = ngw::WallNowMs();
  ngw::detail::Audit(&sink, ngw::AuditKind::kDispatched, "node-1", "", 42);
  REQUIRE(sink.events.size() == 1U);
  const ngw::AuditEvent& ev = sink.events.front();
  CHECK(ev.kind == ngw::AuditKind::kDispatched);
  CHECK(ev.node_id == "node-1");
  CHECK(ev.command_id == 42U);
  CHECK(ev.at_ms >= before);
}

TEST_CASE("audit - null sink and failing sink are tolerated", "[audit]") {
  ngw::detail::Audit(nullptr, ngw::AuditKind::kPaired, "node-2", "code");
  VectorSink failing(false);
  ngw::detail::Audit(&failing, ngw::AuditKind::kPurged, "node-2", "");
  CHECK(failing.events.size() == 1U);
}

TEST_CASE("audit - log sink always reports success", "[audit]") {
  ngw::LogAuditSink sink;
  ngw::AuditEvent ev;
  ev.kind = ngw::AuditKind::kPaired;
  ev.node_id = "node-3";
  ev.detail = "resumed";
  CHECK(sink.Record(ev));
  ev.kind = ngw::AuditKind::kDispatched;
  ev.command_id = 9;
  CHECK(sink.Record(ev));
}
