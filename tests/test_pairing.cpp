/**
 * @file test_pairing.cpp
 * @brief Tests for pairing.hpp: code issue, single use, expiry and collisions.
 */

#include "test_support.hpp"

#include "ngw/pairing.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cctype>
#include <set>
#include <thread>
#include <vector>

using ngw_test::FakeNode;

// ============================================================================
// Helpers
// ============================================================================

struct PairingFixture {
  ngw::ConnectionRegistry registry{ngw_test::FastSession(), 64};
  ngw::PairingCodeIssuer issuer{registry, ngw_test::FastPairing(), ngw_test::FastSession()};
};

struct Redeemed {
  ngw::expected<ngw::NodeInfo, ngw::NodeError> result =
      ngw::expected<ngw::NodeInfo, ngw::NodeError>::error(ngw::NodeError::kCodeNotFound);
  std::unique_ptr<FakeNode> node;
};

/** Redeem @p code on an existing link; the node end is kept alive on success. */
static Redeemed RedeemOn(ngw::PairingCodeIssuer& issuer, const std::string& code,
                         std::unique_ptr<ngw::FramedConnection> gw_side,
                         std::unique_ptr<ngw::FramedConnection> node_side,
                         const std::string& name = "box") {
  ngw::NodeHello hello;
  hello.display_name = name;
  hello.platform = "linux";
  Redeemed out;
  out.result = issuer.Consume(code, gw_side, hello);
  if (out.result.has_value()) {
    out.node.reset(new FakeNode(std::move(node_side)));
  }
  return out;
}

static Redeemed Redeem(ngw::PairingCodeIssuer& issuer, const std::string& code,
                       const std::string& name = "box") {
  std::unique_ptr<ngw::FramedConnection> gw_side;
  std::unique_ptr<ngw::FramedConnection> node_side;
  ngw_test::MakeLink(gw_side, node_side);
  return RedeemOn(issuer, code, std::move(gw_side), std::move(node_side), name);
}

/** Links are made up front so worker threads never assert. */
struct Link {
  std::unique_ptr<ngw::FramedConnection> gw_side;
  std::unique_ptr<ngw::FramedConnection> node_side;
};

static std::vector<Link> MakeLinks(size_t n) {
  std::vector<Link> links(n);
  for (auto& l : links) ngw_test::MakeLink(l.gw_side, l.node_side);
  return links;
}

static bool IsSixDigits(const std::string& code) {
  if (code.size() != 6U) return false;
  for (char c : code) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) return false;
  }
  return true;
}

// ============================================================================
// Identifiers
// ============================================================================

TEST_CASE("pairing - node ids are UUID v4 and tokens are 32 hex", "[pairing]") {
  const std::string id = ngw::detail::NewNodeId();
  REQUIRE(id.size() == 36U);
  CHECK(id[8] == '-');
  CHECK(id[14] == '4');
  CHECK((id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b'));
  CHECK(ngw::detail::NewNodeId() != id);

  const std::string token = ngw::detail::NewSessionToken();
  REQUIRE(token.size() == 32U);
  for (char c : token) CHECK(std::isxdigit(static_cast<unsigned char>(c)) != 0);
}

TEST_CASE("pairing - codes are masked for logs", "[pairing]") {
  CHECK(ngw::detail::MaskCode("482913") == "482***");
  CHECK(ngw::detail::MaskCode("12") == "***");
}

// ============================================================================
// Issue / Consume
// ============================================================================

TEST_CASE("pairing - issued code is six digits with a ttl", "[pairing]") {
  PairingFixture f;
  auto req = f.issuer.Issue("kitchen-pi");
  REQUIRE(req.has_value());
  CHECK(IsSixDigits(req.value().code));
  CHECK(req.value().hint == "kitchen-pi");
  CHECK(req.value().expires_at_ms - req.value().requested_at_ms ==
        ngw_test::FastPairing().code_ttl_ms);
  CHECK(f.issuer.IsActive(req.value().code));
  CHECK(f.issuer.ActiveCount() == 1U);
}

TEST_CASE("pairing - leading zeros are kept", "[pairing]") {
  PairingFixture f;
  f.issuer.SetGenerator([]() { return 42U; });
  auto req = f.issuer.Issue();
  REQUIRE(req.has_value());
  CHECK(req.value().code == "000042");
}

TEST_CASE("pairing - code redeems once then reports already used", "[pairing]") {
  PairingFixture f;
  auto req = f.issuer.Issue();
  REQUIRE(req.has_value());

  auto first = Redeem(f.issuer, req.value().code, "garage");
  REQUIRE(first.result.has_value());
  const ngw::NodeInfo& info = first.result.value();
  CHECK(info.display_name == "garage");
  CHECK(info.connection_state == ngw::ConnectionState::kConnected);
  CHECK(f.registry.IsConnected(info.node_id));
  REQUIRE(ngw_test::WaitFor([&first]() { return first.node->GotAccepted(); }, 1000));
  CHECK(first.node->NodeIdFromGateway() == info.node_id);
  CHECK(!f.issuer.IsActive(req.value().code));

  auto second = Redeem(f.issuer, req.value().code);
  REQUIRE(!second.result.has_value());
  CHECK(second.result.get_error() == ngw::NodeError::kCodeAlreadyUsed);
  CHECK(f.registry.Size() == 1U);
}

TEST_CASE("pairing - unknown code is not found", "[pairing]") {
  PairingFixture f;
  auto r = Redeem(f.issuer, "999999");
  REQUIRE(!r.result.has_value());
  CHECK(r.result.get_error() == ngw::NodeError::kCodeNotFound);
}

TEST_CASE("pairing - rejected code leaves the connection with the caller", "[pairing]") {
  PairingFixture f;
  std::unique_ptr<ngw::FramedConnection> gw_side;
  std::unique_ptr<ngw::FramedConnection> node_side;
  ngw_test::MakeLink(gw_side, node_side);
  auto r = f.issuer.Consume("000000", gw_side, ngw::NodeHello{});
  REQUIRE(!r.has_value());
  REQUIRE(gw_side != nullptr);
  CHECK(gw_side->IsOpen());
}

TEST_CASE("pairing - expired code is refused and swept", "[pairing]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::PairingSettings short_ttl = ngw_test::FastPairing();
  short_ttl.code_ttl_ms = 60;
  ngw::PairingCodeIssuer issuer(registry, short_ttl, ngw_test::FastSession());

  auto a = issuer.Issue();
  auto b = issuer.Issue();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  CHECK(!issuer.IsActive(a.value().code));
  auto r = Redeem(issuer, a.value().code);
  REQUIRE(!r.result.has_value());
  CHECK(r.result.get_error() == ngw::NodeError::kCodeExpired);

  CHECK(issuer.ExpireSweep() == 1U);
  CHECK(issuer.ActiveCount() == 0U);
  CHECK(registry.Size() == 0U);
}

TEST_CASE("pairing - persistent collisions scan to the next free code", "[pairing]") {
  PairingFixture f;
  f.issuer.SetGenerator([]() { return 7U; });
  auto first = f.issuer.Issue();
  REQUIRE(first.has_value());
  CHECK(first.value().code == "000007");

  auto second = f.issuer.Issue();
  REQUIRE(second.has_value());
  CHECK(second.value().code == "000008");
  auto third = f.issuer.Issue();
  REQUIRE(third.has_value());
  CHECK(third.value().code == "000009");
  CHECK(f.issuer.ActiveCount() == 3U);
}

TEST_CASE("pairing - scan wraps around the top of the code space", "[pairing]") {
  PairingFixture f;
  f.issuer.SetGenerator([]() { return 999999U; });
  auto first = f.issuer.Issue();
  REQUIRE(first.has_value());
  CHECK(first.value().code == "999999");
  auto second = f.issuer.Issue();
  REQUIRE(second.has_value());
  CHECK(second.value().code == "000000");
}

TEST_CASE("pairing - collisions retry onto a free code", "[pairing]") {
  PairingFixture f;
  const std::vector<uint32_t> draws = {5U, 5U, 5U, 6U};
  size_t next = 0;
  f.issuer.SetGenerator([&draws, &next]() {
    const uint32_t v = draws[next < draws.size() ? next : draws.size() - 1];
    ++next;
    return v;
  });
  auto first = f.issuer.Issue();
  REQUIRE(first.has_value());
  CHECK(first.value().code == "000005");
  auto second = f.issuer.Issue();
  REQUIRE(second.has_value());
  CHECK(second.value().code == "000006");
  CHECK(next == 4U);
}

TEST_CASE("pairing - capacity rejection is reported", "[pairing]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 1);
  ngw::PairingCodeIssuer issuer(registry, ngw_test::FastPairing(), ngw_test::FastSession());
  auto a = issuer.Issue();
  auto b = issuer.Issue();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  auto ok = Redeem(issuer, a.value().code);
  REQUIRE(ok.result.has_value());
  auto full = Redeem(issuer, b.value().code);
  REQUIRE(!full.result.has_value());
  CHECK(full.result.get_error() == ngw::NodeError::kCapacityReached);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("pairing - concurrent redemptions get distinct node ids", "[pairing]") {
  PairingFixture f;
  constexpr int kNodes = 8;
  std::vector<std::string> codes;
  for (int i = 0; i < kNodes; ++i) {
    auto req = f.issuer.Issue();
    REQUIRE(req.has_value());
    codes.push_back(req.value().code);
  }

  std::vector<Link> links = MakeLinks(kNodes);
  std::vector<Redeemed> results(kNodes);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < static_cast<size_t>(kNodes); ++i) {
    threads.emplace_back([&f, &codes, &results, &links, i]() {
      results[i] = RedeemOn(f.issuer, codes[i], std::move(links[i].gw_side),
                            std::move(links[i].node_side));
    });
  }
  for (auto& t : threads) t.join();

  std::set<std::string> ids;
  for (const auto& r : results) {
    REQUIRE(r.result.has_value());
    ids.insert(r.result.value().node_id);
  }
  CHECK(ids.size() == static_cast<size_t>(kNodes));
  CHECK(f.registry.ConnectedIds().size() == static_cast<size_t>(kNodes));
}

TEST_CASE("pairing - racing redemptions of one code have one winner", "[pairing]") {
  PairingFixture f;
  auto req = f.issuer.Issue();
  REQUIRE(req.has_value());

  const std::string code = req.value().code;
  std::vector<Link> links = MakeLinks(4);
  std::vector<Redeemed> results(4);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&f, &code, &results, &links, i]() {
      results[i] = RedeemOn(f.issuer, code, std::move(links[i].gw_side),
                            std::move(links[i].node_side));
    });
  }
  for (auto& t : threads) t.join();

  int winners = 0;
  for (const auto& r : results) {
    if (r.result.has_value()) {
      ++winners;
    } else {
      CHECK(r.result.get_error() == ngw::NodeError::kCodeAlreadyUsed);
    }
  }
  CHECK(winners == 1);
  CHECK(f.registry.Size() == 1U);
}
