/**
 * @file test_backoff.cpp
 * @brief Tests for backoff.hpp
 */

#include "ngw/backoff.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>

TEST_CASE("backoff - default sequence doubles to the cap", "[backoff]") {
  ngw::Backoff b;
  CHECK(b.Next() == 500U);
  CHECK(b.Next() == 1000U);
  CHECK(b.Next() == 2000U);
  CHECK(b.Next() == 4000U);
  CHECK(b.Next() == 4000U);
  CHECK(b.Attempts() == 5U);
}

TEST_CASE("backoff - reset starts over", "[backoff]") {
  ngw::BackoffPolicy p;
  p.initial_ms = 10;
  p.multiplier = 3;
  p.cap_ms = 50;
  ngw::Backoff b(p);
  CHECK(b.Next() == 10U);
  CHECK(b.Next() == 30U);
  CHECK(b.Next() == 50U);
  b.Reset();
  CHECK(b.Attempts() == 0U);
  CHECK(b.Next() == 10U);
}

TEST_CASE("backoff - initial above cap is clamped", "[backoff]") {
  ngw::BackoffPolicy p;
  p.initial_ms = 900;
  p.cap_ms = 100;
  ngw::Backoff b(p);
  CHECK(b.Next() == 100U);
  CHECK(b.Next() == 100U);
}

TEST_CASE("backoff - RetryUntil returns once the predicate holds", "[backoff]") {
  ngw::BackoffPolicy p;
  p.initial_ms = 5;
  p.cap_ms = 20;
  int calls = 0;
  const bool ok = ngw::RetryUntil([&calls]() { return ++calls == 3; }, p, 1000);
  CHECK(ok);
  CHECK(calls == 3);
}

TEST_CASE("backoff - RetryUntil respects the deadline", "[backoff]") {
  ngw::BackoffPolicy p;
  p.initial_ms = 20;
  p.cap_ms = 40;
  const uint64_t start = ngw::SteadyNowMs();
  const bool ok = ngw::RetryUntil([]() { return false; }, p, 150);
  const uint64_t elapsed = ngw::SteadyNowMs() - start;
  CHECK(!ok);
  CHECK(elapsed >= 150U);
  CHECK(elapsed < 400U);
}
