/**
 * @file test_gateway.cpp
 * @brief Tests for gateway.hpp: listener, handshake rules, shutdown and the
 *        shared instance.
 */

#include "test_support.hpp"

#include "ngw/gateway.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

// ============================================================================
// Helpers
// ============================================================================

static std::unique_ptr<ngw::FramedConnection> ConnectRaw(uint16_t port) {
  auto sock = ngw::TcpSocket::Create();
  REQUIRE(sock.has_value());
  auto addr = ngw::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(addr.has_value());
  REQUIRE(sock.value().Connect(addr.value(), 1000).has_value());
  return std::unique_ptr<ngw::FramedConnection>(
      new ngw::FramedConnection(std::move(sock.value())));
}

/** Send a Pair frame and return the gateway's answer. */
static ngw::PairingResponse PairRaw(ngw::FramedConnection& conn, ngw::PairMode mode,
                                    const std::string& credential) {
  ngw::PairFrame pair;
  pair.mode = mode;
  pair.credential = credential;
  pair.hello.display_name = "raw";
  pair.hello.hostname = "raw.lan";
  REQUIRE(conn.Send(ngw::Message{pair}).has_value());
  auto reply = conn.Receive(2000);
  REQUIRE(reply.has_value());
  const auto* pr = std::get_if<ngw::PairingResponse>(&reply.value());
  REQUIRE(pr != nullptr);
  return *pr;
}

/** Read frames until the link closes; true if the gateway ended with a Close. */
static bool SawCloseBeforeEof(ngw::FramedConnection& conn, ngw::NodeError& reason) {
  for (;;) {
    auto got = conn.Receive(2000);
    if (!got.has_value()) return false;
    if (const auto* close = std::get_if<ngw::CloseFrame>(&got.value())) {
      reason = close->reason;
      return true;
    }
  }
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("gateway - start binds an ephemeral port and stop is idempotent", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  CHECK(!gw.IsRunning());
  REQUIRE(gw.Start().has_value());
  CHECK(gw.IsRunning());
  CHECK(gw.Port() != 0);
  CHECK(gw.Settings().max_nodes == 16U);
  gw.Stop();
  CHECK(!gw.IsRunning());
  gw.Stop();
}

TEST_CASE("gateway - unusable listen address is a bind failure", "[gateway]") {
  ngw::GatewayConfig bad = ngw_test::LoopbackGateway();
  bad.listen_host = "not-an-address";
  ngw::Gateway gw(bad);
  auto r = gw.Start();
  REQUIRE(!r.has_value());
  CHECK(r.get_error() == ngw::NodeError::kBindFailed);
}

TEST_CASE("gateway - port already in use is a bind failure", "[gateway]") {
  ngw::Gateway first(ngw_test::LoopbackGateway());
  REQUIRE(first.Start().has_value());

  ngw::GatewayConfig same = ngw_test::LoopbackGateway();
  same.listen_port = first.Port();
  ngw::Gateway second(same);
  auto r = second.Start();
  REQUIRE(!r.has_value());
  CHECK(r.get_error() == ngw::NodeError::kBindFailed);
}

// ============================================================================
// Handshake
// ============================================================================

TEST_CASE("gateway - valid code pairs a node", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  REQUIRE(gw.Start().has_value());
  auto code = gw.IssueCode("raw-box");
  REQUIRE(code.has_value());

  auto conn = ConnectRaw(gw.Port());
  const ngw::PairingResponse pr = PairRaw(*conn, ngw::PairMode::kCode, code.value().code);
  REQUIRE(pr.accepted);
  CHECK(pr.node_id.size() == 36U);
  CHECK(pr.session_token.size() == 32U);

  CHECK(gw.WaitUntilConnected(pr.node_id, 1000));
  auto status = gw.NodeStatus(pr.node_id);
  REQUIRE(status.has_value());
  CHECK(status.value().display_name == "raw");
  CHECK(status.value().hostname == "raw.lan");
  REQUIRE(gw.ListNodes().size() == 1U);
  CHECK(!gw.Issuer().IsActive(code.value().code));
}

TEST_CASE("gateway - readiness wait gives up on unknown nodes", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  REQUIRE(gw.Start().has_value());
  const uint64_t start = ngw::SteadyNowMs();
  CHECK(!gw.WaitUntilConnected("no-such-node", 150));
  const uint64_t elapsed = ngw::SteadyNowMs() - start;
  CHECK(elapsed >= 140U);
  CHECK(elapsed < 400U);
}

TEST_CASE("gateway - unknown code is rejected and the link closed", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  REQUIRE(gw.Start().has_value());
  auto conn = ConnectRaw(gw.Port());
  const ngw::PairingResponse pr = PairRaw(*conn, ngw::PairMode::kCode, "123456");
  CHECK(!pr.accepted);
  CHECK(pr.reason == ngw::NodeError::kCodeNotFound);
  auto next = conn->Receive(1000);
  REQUIRE(!next.has_value());
  CHECK(next.get_error() == ngw::NodeError::kConnectionLost);
  CHECK(gw.ListNodes().empty());
}

TEST_CASE("gateway - unknown token is rejected", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  REQUIRE(gw.Start().has_value());
  auto conn = ConnectRaw(gw.Port());
  const ngw::PairingResponse pr =
      PairRaw(*conn, ngw::PairMode::kToken, "00000000000000000000000000000000");
  CHECK(!pr.accepted);
  CHECK(pr.reason == ngw::NodeError::kTokenRejected);
}

TEST_CASE("gateway - first frame other than Pair is a protocol violation", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  REQUIRE(gw.Start().has_value());
  auto conn = ConnectRaw(gw.Port());

  ngw::HeartbeatFrame hb;
  hb.timestamp_us = ngw::SteadyNowUs();
  REQUIRE(conn->Send(ngw::Message{hb}).has_value());
  auto reply = conn->Receive(2000);
  REQUIRE(reply.has_value());
  const auto* pr = std::get_if<ngw::PairingResponse>(&reply.value());
  REQUIRE(pr != nullptr);
  CHECK(!pr->accepted);
  CHECK(pr->reason == ngw::NodeError::kProtocolViolation);
}

TEST_CASE("gateway - silent client is dropped after the handshake timeout", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  REQUIRE(gw.Start().has_value());
  const uint64_t start = ngw::SteadyNowMs();
  auto conn = ConnectRaw(gw.Port());
  auto got = conn->Receive(2000);
  const uint64_t elapsed = ngw::SteadyNowMs() - start;
  REQUIRE(!got.has_value());
  CHECK(got.get_error() == ngw::NodeError::kConnectionLost);
  CHECK(elapsed >= 150U);
  CHECK(elapsed < 1000U);
}

TEST_CASE("gateway - pairing beyond capacity is refused", "[gateway]") {
  ngw::GatewayConfig cfg = ngw_test::LoopbackGateway();
  cfg.max_nodes = 1;
  ngw::Gateway gw(cfg);
  REQUIRE(gw.Start().has_value());
  auto a = gw.IssueCode();
  auto b = gw.IssueCode();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());

  auto first = ConnectRaw(gw.Port());
  REQUIRE(PairRaw(*first, ngw::PairMode::kCode, a.value().code).accepted);

  auto second = ConnectRaw(gw.Port());
  const ngw::PairingResponse pr = PairRaw(*second, ngw::PairMode::kCode, b.value().code);
  CHECK(!pr.accepted);
  CHECK(pr.reason == ngw::NodeError::kCapacityReached);
  CHECK(gw.ListNodes().size() == 1U);
  // The refused code is still redeemable once a slot frees up.
  CHECK(gw.Issuer().IsActive(b.value().code));
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("gateway - stop sends Close to connected nodes", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  REQUIRE(gw.Start().has_value());
  auto code = gw.IssueCode();
  REQUIRE(code.has_value());
  auto conn = ConnectRaw(gw.Port());
  const ngw::PairingResponse pr = PairRaw(*conn, ngw::PairMode::kCode, code.value().code);
  REQUIRE(pr.accepted);
  REQUIRE(gw.WaitUntilConnected(pr.node_id, 1000));

  gw.Stop();
  ngw::NodeError reason = ngw::NodeError::kConnectionLost;
  CHECK(SawCloseBeforeEof(*conn, reason));
  CHECK(reason == ngw::NodeError::kNotRunning);
  CHECK(gw.ListNodes().empty());
}

TEST_CASE("gateway - operations on an unknown node", "[gateway]") {
  ngw::Gateway gw(ngw_test::LoopbackGateway());
  REQUIRE(gw.Start().has_value());
  CHECK(!gw.IsConnected("ghost"));
  CHECK(!gw.NodeStatus("ghost").has_value());
  auto r = gw.Send("ghost", "uptime");
  REQUIRE(!r.has_value());
  CHECK(r.get_error() == ngw::NodeError::kNodeNotConnected);
  CHECK(gw.Broadcast("uptime").empty());
  CHECK(!gw.Cancel(1));
}

// ============================================================================
// SharedGateway
// ============================================================================

TEST_CASE("gateway - shared instance is created once", "[gateway]") {
  CHECK(ngw::SharedGateway::Current() == nullptr);

  auto first = ngw::SharedGateway::Acquire(ngw_test::LoopbackGateway());
  REQUIRE(first.has_value());
  ngw::GatewayConfig other = ngw_test::LoopbackGateway();
  other.max_nodes = 3;
  auto second = ngw::SharedGateway::Acquire(other);
  REQUIRE(second.has_value());
  CHECK(first.value() == second.value());
  CHECK(second.value()->Settings().max_nodes == 16U);
  CHECK(ngw::SharedGateway::Current() == first.value());

  ngw::SharedGateway::Teardown();
  CHECK(ngw::SharedGateway::Current() == nullptr);
  CHECK(!first.value()->IsRunning());
}

TEST_CASE("gateway - shared instance reports a failed start", "[gateway]") {
  ngw::GatewayConfig bad = ngw_test::LoopbackGateway();
  bad.listen_host = "bogus";
  auto r = ngw::SharedGateway::Acquire(bad);
  REQUIRE(!r.has_value());
  CHECK(r.get_error() == ngw::NodeError::kBindFailed);
  CHECK(ngw::SharedGateway::Current() == nullptr);
}
