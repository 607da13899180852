/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp and the shared types in types.hpp
 */

#include "ngw/types.hpp"
#include "ngw/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>
#include <vector>

enum class TestError : uint8_t { kFirst = 0, kSecond };

// ============================================================================
// expected
// ============================================================================

TEST_CASE("expected - success holds value", "[vocabulary]") {
  auto r = ngw::expected<std::string, TestError>::success(std::string("node"));
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  CHECK(r.value() == "node");
  CHECK(r.value_or("other") == "node");
}

TEST_CASE("expected - error holds error code", "[vocabulary]") {
  auto r = ngw::expected<int, TestError>::error(TestError::kSecond);
  REQUIRE(!r.has_value());
  CHECK(r.get_error() == TestError::kSecond);
  CHECK(r.value_or(42) == 42);
}

TEST_CASE("expected - copy and move keep the active member", "[vocabulary]") {
  auto ok = ngw::expected<std::vector<int>, TestError>::success(std::vector<int>{1, 2, 3});
  auto copy = ok;
  REQUIRE(copy.has_value());
  CHECK(copy.value().size() == 3U);

  auto moved = std::move(copy);
  REQUIRE(moved.has_value());
  CHECK(moved.value()[2] == 3);

  auto err = ngw::expected<std::vector<int>, TestError>::error(TestError::kFirst);
  moved = err;
  REQUIRE(!moved.has_value());
  CHECK(moved.get_error() == TestError::kFirst);
}

TEST_CASE("expected - void specialization", "[vocabulary]") {
  auto ok = ngw::expected<void, TestError>::success();
  CHECK(ok.has_value());
  auto bad = ngw::expected<void, TestError>::error(TestError::kSecond);
  REQUIRE(!bad.has_value());
  CHECK(bad.get_error() == TestError::kSecond);
}

// ============================================================================
// optional
// ============================================================================

TEST_CASE("optional - empty and engaged", "[vocabulary]") {
  ngw::optional<std::string> empty;
  CHECK(!empty.has_value());
  CHECK(empty.value_or("fallback") == "fallback");

  ngw::optional<std::string> full(std::string("abc"));
  REQUIRE(full.has_value());
  CHECK(full.value() == "abc");

  full.reset();
  CHECK(!full.has_value());
}

TEST_CASE("optional - assignment replaces contents", "[vocabulary]") {
  ngw::optional<int64_t> a(int64_t{7});
  ngw::optional<int64_t> b;
  b = a;
  REQUIRE(b.has_value());
  CHECK(b.value() == 7);
  a = ngw::optional<int64_t>();
  CHECK(!a.has_value());
}

// ============================================================================
// Clock helpers
// ============================================================================

TEST_CASE("clock - steady clock is monotonic and unit-consistent", "[vocabulary]") {
  const uint64_t ms1 = ngw::SteadyNowMs();
  const uint64_t us = ngw::SteadyNowUs();
  const uint64_t ms2 = ngw::SteadyNowMs();
  CHECK(ms2 >= ms1);
  CHECK(us / 1000U >= ms1);
  CHECK(ngw::WallNowMs() > 1600000000000ULL);
}

// ============================================================================
// Shared types
// ============================================================================

TEST_CASE("types - NodeError names are stable", "[vocabulary]") {
  CHECK(std::strcmp(ngw::ToString(ngw::NodeError::kCodeNotFound), "code_not_found") == 0);
  CHECK(std::strcmp(ngw::ToString(ngw::NodeError::kTokenRejected), "token_rejected") == 0);
  CHECK(std::strcmp(ngw::ToString(ngw::ConnectionState::kDisconnected), "disconnected") ==
        0);
  CHECK(std::strcmp(ngw::ToString(ngw::SessionState::kDraining), "draining") == 0);
  CHECK(std::strcmp(ngw::ToString(ngw::ResponseStatus::kTimeout), "timeout") == 0);
}

TEST_CASE("types - out-of-range wire error maps to protocol violation", "[vocabulary]") {
  CHECK(ngw::NodeErrorFromWire(0) == ngw::NodeError::kProtocolViolation);
  CHECK(ngw::NodeErrorFromWire(200) == ngw::NodeError::kProtocolViolation);
  CHECK(ngw::NodeErrorFromWire(static_cast<uint8_t>(ngw::NodeError::kCancelled)) ==
        ngw::NodeError::kCancelled);
}

TEST_CASE("types - response constructors", "[vocabulary]") {
  auto ok = ngw::NodeResponse::Success(5, "done", 100);
  CHECK(ok.ok());
  CHECK(ok.command_id == 5U);
  CHECK(ok.result == "done");

  auto fail = ngw::NodeResponse::Failure(6, ngw::NodeError::kCancelled, "stop", 101);
  CHECK(!fail.ok());
  CHECK(fail.status == ngw::ResponseStatus::kFailure);
  CHECK(fail.failure == ngw::NodeError::kCancelled);

  auto late = ngw::NodeResponse::TimedOut(7, 102);
  CHECK(late.status == ngw::ResponseStatus::kTimeout);

  auto rej = ngw::PairingResponse::Rejected(ngw::NodeError::kCodeExpired);
  CHECK(!rej.accepted);
  CHECK(rej.reason_text == "code_expired");
}
